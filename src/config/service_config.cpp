/**
 * @file service_config.cpp
 * @brief Service configuration loading and TableCatalog.
 *
 * @copyright Copyright (c) 2024 ingestd Contributors
 * @license MIT License
 */

#include "ingestd/config/service_config.hpp"
#include "ingestd/utils/logger.hpp"

#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace ingestd {
namespace config {

namespace {

bool isKnownFieldType(const std::string& type) {
    return type == "string" || type == "int32" || type == "int64" ||
           type == "float" || type == "double" || type == "bool";
}

bool fail(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
    return false;
}

}  // namespace

bool parseServiceConfig(const std::string& json, ServiceConfig* config, std::string* error) {
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;

    config->Clear();
    auto status = google::protobuf::util::JsonStringToMessage(json, config, options);
    if (!status.ok()) {
        return fail(error, "invalid configuration JSON: " + status.ToString());
    }
    return true;
}

bool loadServiceConfig(const std::string& path, ServiceConfig* config, std::string* error) {
    std::ifstream in(path);
    if (!in) {
        return fail(error, "cannot open configuration file " + path);
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    if (!parseServiceConfig(buffer.str(), config, error)) {
        return false;
    }
    return validateServiceConfig(*config, error);
}

bool validateServiceConfig(const ServiceConfig& config, std::string* error) {
    if (config.remote().server_endpoint().empty()) {
        return fail(error, "remote.server_endpoint is required");
    }
    if (config.tables().empty()) {
        return fail(error, "no tables configured");
    }

    for (const auto& [key, table] : config.tables()) {
        const std::string where = "table '" + key + "'";
        if (key.empty()) {
            return fail(error, "table keys must not be empty");
        }
        if (table.table_name().empty()) {
            return fail(error, where + ": table_name is required");
        }
        if (table.message_name().empty()) {
            return fail(error, where + ": message_name is required");
        }
        if (table.fields().empty()) {
            return fail(error, where + ": at least one field is required");
        }
        if (table.ack_timeout_ms() < 0) {
            return fail(error, where + ": ack_timeout_ms must not be negative");
        }

        std::unordered_set<std::string> names;
        for (const auto& field : table.fields()) {
            if (field.name().empty()) {
                return fail(error, where + ": field names must not be empty");
            }
            if (!names.insert(field.name()).second) {
                return fail(error, where + ": duplicate field '" + field.name() + "'");
            }
        }
    }
    return true;
}

bool loadCredentials(Credentials* credentials, std::string* error) {
    const char* id = std::getenv(kClientIdEnv);
    const char* secret = std::getenv(kClientSecretEnv);

    if (id == nullptr || *id == '\0' || secret == nullptr || *secret == '\0') {
        return fail(error, std::string(kClientIdEnv) + " and " + kClientSecretEnv +
                           " environment variables are required");
    }

    credentials->client_id = id;
    credentials->client_secret = secret;
    return true;
}

std::string normalizeEndpoint(const std::string& endpoint) {
    std::string result = endpoint;
    for (const char* scheme : {"https://", "http://"}) {
        std::string prefix(scheme);
        if (result.compare(0, prefix.size(), prefix) == 0) {
            result.erase(0, prefix.size());
            break;
        }
    }
    while (!result.empty() && result.back() == '/') {
        result.pop_back();
    }
    return result;
}

// =============================================================================
// TableCatalog
// =============================================================================

std::unique_ptr<TableCatalog> TableCatalog::build(const ServiceConfig& config,
                                                  const Credentials& credentials,
                                                  std::string* error) {
    std::unique_ptr<TableCatalog> catalog(new TableCatalog());
    catalog->remote_ = config.remote();

    const std::string endpoint = normalizeEndpoint(config.remote().server_endpoint());

    for (const auto& [key, table] : config.tables()) {
        std::vector<schema::FieldDef> fields;
        fields.reserve(table.fields_size());
        for (const auto& field : table.fields()) {
            if (!isKnownFieldType(field.type())) {
                LOG_WARN("Config", "Table '{}': unknown type '{}' for field '{}', using string",
                         key, field.type(), field.name());
            }
            schema::FieldDef def;
            def.name = field.name();
            def.type = schema::parseFieldType(field.type());
            fields.push_back(def);
        }

        std::string schemaError;
        auto recordSchema = schema::RecordSchema::build(table.message_name(), fields, &schemaError);
        if (!recordSchema) {
            fail(error, "table '" + key + "': " + schemaError);
            return nullptr;
        }

        TableEntry entry;
        entry.key = key;
        entry.table = table;

        entry.destination.key = key;
        entry.destination.endpoint = endpoint;
        entry.destination.table_name = table.table_name();
        entry.destination.message_name = table.message_name();
        entry.destination.descriptor = recordSchema->descriptorBytes();
        entry.destination.client_id = credentials.client_id;
        entry.destination.client_secret = credentials.client_secret;
        entry.destination.durable_by_default = table.durable_by_default();
        entry.destination.ack_timeout_ms = table.ack_timeout_ms();

        entry.schema = std::move(recordSchema);
        catalog->tables_.emplace(key, std::move(entry));
    }

    return catalog;
}

const TableEntry* TableCatalog::find(const std::string& key) const {
    auto it = tables_.find(key);
    return it != tables_.end() ? &it->second : nullptr;
}

std::vector<core::DestinationConfig> TableCatalog::destinations() const {
    std::vector<core::DestinationConfig> result;
    result.reserve(tables_.size());
    for (const auto& [key, entry] : tables_) {
        result.push_back(entry.destination);
    }
    return result;
}

std::vector<std::string> TableCatalog::keys() const {
    std::vector<std::string> result;
    result.reserve(tables_.size());
    for (const auto& [key, entry] : tables_) {
        result.push_back(key);
    }
    return result;
}

}  // namespace config
}  // namespace ingestd
