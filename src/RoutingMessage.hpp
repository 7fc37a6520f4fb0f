#pragma once
#include "RoutingTable.hpp"
#include "utils.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <nlohmann/json.hpp>

// Distance-vector advertisement exchanged between agents.
struct RoutingMessage
{
    std::string sender;
    uint64_t sequence = 0;
    SimTime timestamp;
    std::map<std::string, Advertised> routes;
    std::string hmac; // hex HMAC-SHA256 of the canonical form, empty when unsigned
};

// Canonical JSON form, without the hmac field.
nlohmann::json toJson(const RoutingMessage &message);

void signMessage(RoutingMessage &message, const std::string &key);

// An empty key accepts everything. Otherwise the hmac must match.
bool verifyMessage(const RoutingMessage &message, const std::string &key);
