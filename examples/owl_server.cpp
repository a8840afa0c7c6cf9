/**
 * owl JSON-lines front end
 *
 * Reads one JSON request per line on stdin and writes one JSON response
 * per line on stdout. Configuration comes from the environment
 * (OLLAMA_API_URL, OLLAMA_MODEL, GOOGLE_API_KEY, GOOGLE_CSE_ID,
 * OWL_HISTORY_DB, OWL_LOG_LEVEL, ...).
 *
 * Requests:
 *   {"type": "chat", "prompt": "...", "search": true, "user_id": "alice"}
 *   {"type": "history", "user_id": "alice"}
 *   {"type": "clear", "user_id": "alice"}
 *
 * Usage:
 *   echo '{"type":"chat","prompt":"Weather in Chicago, IL?"}' | ./owl_server
 */

#include "owl/owl.hpp"

#include <iostream>
#include <string>

int main() {
    auto config = owl::load_config_from_environment();
    if (!config) {
        std::cerr << "Invalid configuration: " << config.error().to_string() << std::endl;
        return 1;
    }

    auto agent = owl::Agent::create(*config);
    if (!agent) {
        std::cerr << "Failed to create agent: " << agent.error().to_string() << std::endl;
        return 1;
    }

    OWL_LOG_INFO("owl ready: model=%s backend=%s", config->model.c_str(), config->backend_url.c_str());

    owl::api::RequestHandler handler(**agent);
    std::string line;
    while (std::getline(std::cin, line)) {
        if (owl::util::trim(line).empty()) {
            continue;
        }
        std::cout << handler.handle_line(line) << std::endl;
    }
    return 0;
}
