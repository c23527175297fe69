/**
 * @file urlbridge.hpp
 * @brief Include every public header of the library
 * @version 0.1
 * @date 2026-03-02
 * 
 * @copyright Copyright (c) 2026
 * 
 */
#pragma once

#include <urlbridge/ordered_request.hpp>
#include <urlbridge/curl_engine.hpp>
#include <urlbridge/executor.hpp>
#include <urlbridge/request_status.hpp>
#include <urlbridge/response.hpp>
#include <urlbridge/client.hpp>
#include <urlbridge/bridge.hpp>
#include <urlbridge/upload.hpp>
#include <urlbridge/error.hpp>
#include <urlbridge/body.hpp>
#include <urlbridge/log.hpp>
