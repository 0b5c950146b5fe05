/**
 * @file record_schema.hpp
 * @brief Per-table record validation and protobuf encoding.
 *
 * A RecordSchema is built once per configured table from its declared
 * field list. It synthesizes a protobuf message type at runtime, checks
 * incoming JSON records against it and encodes them into the wire bytes
 * the remote stream expects.
 *
 * @copyright Copyright (c) 2024 ingestd Contributors
 * @license MIT License
 */

#pragma once

#include "ingestd/schema/export.hpp"

#include <google/protobuf/descriptor.h>
#include <google/protobuf/dynamic_message.h>
#include <google/protobuf/struct.pb.h>

#include <memory>
#include <string>
#include <vector>

namespace ingestd {
namespace schema {

/**
 * @enum FieldType
 * @brief Declared type of a record field.
 */
enum class FieldType {
    STRING,
    INT32,
    INT64,
    FLOAT,
    DOUBLE,
    BOOL
};

inline const char* fieldTypeToString(FieldType type) {
    switch (type) {
        case FieldType::STRING: return "string";
        case FieldType::INT32: return "int32";
        case FieldType::INT64: return "int64";
        case FieldType::FLOAT: return "float";
        case FieldType::DOUBLE: return "double";
        case FieldType::BOOL: return "bool";
        default: return "string";
    }
}

/**
 * @brief Map a configured type name to a FieldType.
 *
 * Unrecognized names map to STRING.
 */
INGESTD_SCHEMA_API FieldType parseFieldType(const std::string& name);

/**
 * @struct FieldDef
 * @brief One declared field, in declaration order.
 */
struct FieldDef {
    std::string name;
    FieldType type = FieldType::STRING;
};

/**
 * @struct EncodeResult
 * @brief Result of RecordSchema::encode.
 */
struct EncodeResult {
    bool success = false;
    std::string payload;                    ///< Serialized record
    std::vector<std::string> errors;        ///< One entry per offending field
    std::string error_message;              ///< errors joined for display
};

/**
 * @class RecordSchema
 * @brief Validates and encodes records for one table.
 *
 * Immutable after build(); safe to share across threads.
 *
 * Usage:
 * @code
 * std::string error;
 * auto schema = RecordSchema::build("Order", {{"id", FieldType::INT64}}, &error);
 *
 * google::protobuf::Struct record;
 * (*record.mutable_fields())["id"].set_number_value(42);
 * auto encoded = schema->encode(record);
 * @endcode
 */
class INGESTD_SCHEMA_API RecordSchema {
public:
    /**
     * @brief Build a schema.
     * @param messageName Name of the synthesized message type.
     * @param fields Declared fields; numbered 1..n in this order.
     * @param error Receives the reason when the field list is rejected.
     * @return The schema, or nullptr on error.
     */
    static std::unique_ptr<RecordSchema> build(const std::string& messageName,
                                               const std::vector<FieldDef>& fields,
                                               std::string* error);

    ~RecordSchema();

    RecordSchema(const RecordSchema&) = delete;
    RecordSchema& operator=(const RecordSchema&) = delete;

    /**
     * @brief Validate a record and encode it.
     *
     * Every declared field must be present and non-null with a value of
     * its declared type; undeclared fields are ignored.
     */
    EncodeResult encode(const google::protobuf::Struct& record) const;

    /**
     * @brief Decode bytes produced by encode() back into a record.
     */
    bool decode(const std::string& payload,
                google::protobuf::Struct* record,
                std::string* error) const;

    const std::string& messageName() const { return messageName_; }
    const std::vector<FieldDef>& fields() const { return fields_; }

    /**
     * @brief Serialized google.protobuf.DescriptorProto of the record type.
     */
    const std::string& descriptorBytes() const { return descriptorBytes_; }

private:
    RecordSchema(std::string messageName, std::vector<FieldDef> fields);

    std::string messageName_;
    std::vector<FieldDef> fields_;
    std::string descriptorBytes_;

    std::unique_ptr<google::protobuf::DescriptorPool> pool_;
    std::unique_ptr<google::protobuf::DynamicMessageFactory> factory_;
    const google::protobuf::Descriptor* descriptor_ = nullptr;
    const google::protobuf::Message* prototype_ = nullptr;
};

}  // namespace schema
}  // namespace ingestd
