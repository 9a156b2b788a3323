// Example: Serving a user resource through the projection pipeline

#include "cache/projection_cache_manager.h"
#include "config/projection_config.h"
#include "server/cache_invalidator.h"
#include "server/projection_pipeline.h"
#include "utils/logger.h"
#include <iostream>
#include <map>
#include <string>

using namespace prism;
using json = nlohmann::ordered_json;

namespace {

std::map<std::string, json> users = {
    {"1", {{"id", 1}, {"name", "Ada"}, {"email", "ada@example.com"},
           {"profile", {{"avatar", "ada.png"}, {"bio", "Analyst"}}}, {"ssn", "000-00-0000"}}},
    {"2", {{"id", 2}, {"name", "Alan"}, {"email", "alan@example.com"},
           {"profile", {{"avatar", "alan.png"}, {"bio", "Logician"}}}, {"ssn", "111-11-1111"}}}
};

server::HandlerResult loadUser(const std::string& id) {
    server::HandlerResult result;
    auto it = users.find(id);
    if (it == users.end()) {
        result.status = 404;
        result.body = {{"message", "user " + id + " not found"}};
        return result;
    }
    std::cout << "  (handler loaded user " << id << ")\n";
    result.body = it->second;
    return result;
}

void print(const std::string& label, const server::ProjectionResponse& resp) {
    std::cout << label << " -> " << resp.status;
    auto cache = resp.headers.find("X-Cache");
    if (cache != resp.headers.end()) {
        std::cout << " [" << cache->second << "]";
    }
    std::cout << "\n  " << (resp.body.is_null() ? "<empty>" : resp.body.dump()) << "\n";
}

server::ProjectionRequest get(const std::string& path, const std::string& fields = "") {
    server::ProjectionRequest req;
    req.path = path;
    if (!fields.empty()) {
        req.headers["X-Response-Fields"] = fields;
    }
    return req;
}

} // namespace

int main(int argc, char** argv) {
    // 1. Configuration (optional YAML path as first argument)
    config::ProjectionConfig cfg = argc > 1 ? config::ProjectionConfig::loadFromYaml(argv[1])
                                            : config::ProjectionConfig();
    utils::Logger::init(cfg.logging.file, utils::Logger::levelFromString(cfg.logging.level));

    for (const auto& problem : cfg.validate()) {
        PRISM_WARN("Configuration: {}", problem);
    }

    // 2. One cache per process, owned here and shared by reference
    cache::ProjectionCacheManager cache(cfg.cache);
    server::ProjectionPipeline pipeline(cfg, cache);
    server::CacheInvalidator invalidator(cache);

    // 3. Route registration: GET /users/{id} with an allow-list
    server::EndpointOptions user_options;
    user_options.ttl_seconds = 30;
    user_options.allowed_fields = {"id", "name", "email", "profile(avatar,bio)"};
    server::ProjectableEndpoint user_endpoint(user_options);

    auto handleGet = [&](const server::ProjectionRequest& req, const std::string& id) {
        return pipeline.handle(req, user_endpoint, [&] { return loadUser(id); });
    };

    // 4. Requests
    print("GET /users/1 (full)", handleGet(get("/users/1"), "1"));
    print("GET /users/1 fields=id,name", handleGet(get("/users/1", "id,name"), "1"));
    print("GET /users/1 fields=profile(bio)", handleGet(get("/users/1", "profile(bio)"), "1"));
    print("GET /users/1 fields=ssn", handleGet(get("/users/1", "ssn"), "1"));
    print("GET /users/1 fields=id,,name", handleGet(get("/users/1", "id,,name"), "1"));
    print("GET /users/9", handleGet(get("/users/9", "id"), "9"));

    auto first = handleGet(get("/users/2"), "2");
    auto conditional = get("/users/2");
    conditional.headers["If-None-Match"] = first.headers["ETag"];
    print("GET /users/2 If-None-Match", handleGet(conditional, "2"));

    // 5. Write path: PUT /users/1 evicts the cached document
    auto updated = invalidator.invalidateAfter([&] {
        users["1"]["name"] = "Ada Lovelace";
        server::HandlerResult r;
        r.status = 204;
        return r;
    }, {"/users/{id}"}, {{"id", "1"}});
    std::cout << "PUT /users/1 -> " << updated.status << "\n";

    print("GET /users/1 fields=name", handleGet(get("/users/1", "name"), "1"));

    std::cout << "\nCache stats: " << cache.getStats().toJson().dump(2) << "\n";

    utils::Logger::shutdown();
    return 0;
}
