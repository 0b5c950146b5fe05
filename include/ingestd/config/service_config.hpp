/**
 * @file service_config.hpp
 * @brief Service configuration file, credentials and the table catalog.
 *
 * The service configuration is a JSON document mapped onto the
 * ingestd.config.ServiceConfig message. It is loaded once at startup;
 * TableCatalog then resolves every configured table into a record schema
 * and a core::DestinationConfig, and stays read-only afterwards.
 *
 * @copyright Copyright (c) 2024 ingestd Contributors
 * @license MIT License
 */

#pragma once

#include "ingestd/config/export.hpp"
#include "ingestd/core/remote_stream.hpp"
#include "ingestd/schema/record_schema.hpp"

#include "ingestd/proto/config.pb.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ingestd {
namespace config {

constexpr const char* kClientIdEnv = "INGESTD_CLIENT_ID";
constexpr const char* kClientSecretEnv = "INGESTD_CLIENT_SECRET";

/**
 * @struct Credentials
 * @brief Opaque credentials forwarded to the sink on every stream.
 */
struct Credentials {
    std::string client_id;
    std::string client_secret;
};

/**
 * @brief Parse a JSON document into a ServiceConfig.
 *
 * Unknown keys are ignored. The result is not validated.
 */
INGESTD_CONFIG_API bool parseServiceConfig(const std::string& json,
                                           ServiceConfig* config,
                                           std::string* error);

/**
 * @brief Read, parse and validate a configuration file.
 */
INGESTD_CONFIG_API bool loadServiceConfig(const std::string& path,
                                          ServiceConfig* config,
                                          std::string* error);

/**
 * @brief Check a parsed configuration.
 *
 * Requires a sink endpoint and at least one table; every table needs a
 * table_name, a message_name and at least one field, with unique,
 * non-empty field names and a non-negative ack_timeout_ms.
 */
INGESTD_CONFIG_API bool validateServiceConfig(const ServiceConfig& config, std::string* error);

/**
 * @brief Read INGESTD_CLIENT_ID and INGESTD_CLIENT_SECRET.
 * @return False (with @p error set) if either is missing or empty.
 */
INGESTD_CONFIG_API bool loadCredentials(Credentials* credentials, std::string* error);

/**
 * @brief Strip an http:// or https:// scheme and any trailing slash.
 */
INGESTD_CONFIG_API std::string normalizeEndpoint(const std::string& endpoint);

/**
 * @struct TableEntry
 * @brief Everything known about one configured table.
 */
struct TableEntry {
    std::string key;
    TableConfig table;
    std::shared_ptr<const schema::RecordSchema> schema;
    core::DestinationConfig destination;
};

/**
 * @class TableCatalog
 * @brief Immutable lookup of configured tables by key.
 *
 * Usage:
 * @code
 * std::string error;
 * auto catalog = TableCatalog::build(serviceConfig, credentials, &error);
 * StreamLifecycleManager manager(catalog->destinations(), transport);
 *
 * const TableEntry* entry = catalog->find("orders");
 * auto encoded = entry->schema->encode(record);
 * @endcode
 */
class INGESTD_CONFIG_API TableCatalog {
public:
    /**
     * @brief Build schemas and destinations for a validated configuration.
     * @return The catalog, or nullptr if a table's schema is rejected.
     */
    static std::unique_ptr<TableCatalog> build(const ServiceConfig& config,
                                               const Credentials& credentials,
                                               std::string* error);

    /**
     * @return The entry, or nullptr if @p key is not configured.
     */
    const TableEntry* find(const std::string& key) const;

    std::vector<core::DestinationConfig> destinations() const;

    /**
     * @brief Configured keys, sorted.
     */
    std::vector<std::string> keys() const;

    size_t size() const { return tables_.size(); }

    const RemoteEndpoint& remote() const { return remote_; }

private:
    TableCatalog() = default;

    RemoteEndpoint remote_;
    std::map<std::string, TableEntry> tables_;
};

}  // namespace config
}  // namespace ingestd
