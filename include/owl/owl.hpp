#pragma once

/**
 * @file owl.hpp
 * @brief Main convenience header for owl
 *
 * Include this single header to get access to all public owl APIs.
 *
 * owl is a C++17 conversational agent that answers through an
 * OpenAI-compatible generation backend, calls tools with JSON directives
 * and grounds answers in live web information.
 *
 * Quick Start:
 * @code
 * #include <owl/owl.hpp>
 *
 * int main() {
 *     auto config = owl::load_config_from_environment();
 *     if (!config) {
 *         std::cerr << "Error: " << config.error().to_string() << std::endl;
 *         return 1;
 *     }
 *
 *     auto agent = owl::Agent::create(*config);
 *     if (!agent) {
 *         std::cerr << "Error: " << agent.error().to_string() << std::endl;
 *         return 1;
 *     }
 *
 *     auto reply = (*agent)->handle("Who founded Purdue University?", true);
 *     if (reply) {
 *         std::cout << reply->response << std::endl;
 *     }
 *     return 0;
 * }
 * @endcode
 */

#include "types.hpp"
#include "log.hpp"
#include "config.hpp"
#include "agent.hpp"
#include "api/request_handler.hpp"
