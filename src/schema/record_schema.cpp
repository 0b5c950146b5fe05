/**
 * @file record_schema.cpp
 * @brief RecordSchema implementation.
 *
 * @copyright Copyright (c) 2024 ingestd Contributors
 * @license MIT License
 */

#include "ingestd/schema/record_schema.hpp"
#include "ingestd/utils/logger.hpp"

#include <google/protobuf/descriptor.pb.h>

#include <cmath>
#include <limits>
#include <unordered_set>

namespace ingestd {
namespace schema {

using google::protobuf::Descriptor;
using google::protobuf::DescriptorPool;
using google::protobuf::FieldDescriptor;
using google::protobuf::FieldDescriptorProto;
using google::protobuf::Message;
using google::protobuf::Reflection;
using google::protobuf::Value;

namespace {

constexpr const char* kRecordPackage = "ingestd.records";

class CollectingErrors : public DescriptorPool::ErrorCollector {
public:
    void AddError(const std::string& filename,
                  const std::string& element_name,
                  const Message* descriptor,
                  ErrorLocation location,
                  const std::string& message) override {
        if (!errors.empty()) {
            errors += "; ";
        }
        errors += element_name + ": " + message;
    }

    std::string errors;
};

FieldDescriptorProto::Type protoType(FieldType type) {
    switch (type) {
        case FieldType::INT32: return FieldDescriptorProto::TYPE_INT32;
        case FieldType::INT64: return FieldDescriptorProto::TYPE_INT64;
        case FieldType::FLOAT: return FieldDescriptorProto::TYPE_FLOAT;
        case FieldType::DOUBLE: return FieldDescriptorProto::TYPE_DOUBLE;
        case FieldType::BOOL: return FieldDescriptorProto::TYPE_BOOL;
        case FieldType::STRING:
        default:
            return FieldDescriptorProto::TYPE_STRING;
    }
}

const char* kindName(const Value& value) {
    switch (value.kind_case()) {
        case Value::kNullValue: return "null";
        case Value::kNumberValue: return "number";
        case Value::kStringValue: return "string";
        case Value::kBoolValue: return "bool";
        case Value::kStructValue: return "object";
        case Value::kListValue: return "array";
        default: return "nothing";
    }
}

bool isIntegral(double value) {
    return std::isfinite(value) && std::trunc(value) == value;
}

}  // namespace

FieldType parseFieldType(const std::string& name) {
    if (name == "int32") return FieldType::INT32;
    if (name == "int64") return FieldType::INT64;
    if (name == "float") return FieldType::FLOAT;
    if (name == "double") return FieldType::DOUBLE;
    if (name == "bool") return FieldType::BOOL;
    return FieldType::STRING;
}

// =============================================================================
// Build
// =============================================================================

RecordSchema::RecordSchema(std::string messageName, std::vector<FieldDef> fields)
    : messageName_(std::move(messageName))
    , fields_(std::move(fields))
    , pool_(std::make_unique<DescriptorPool>())
{}

RecordSchema::~RecordSchema() = default;

std::unique_ptr<RecordSchema> RecordSchema::build(const std::string& messageName,
                                                  const std::vector<FieldDef>& fields,
                                                  std::string* error) {
    if (messageName.empty()) {
        if (error) *error = "message name is empty";
        return nullptr;
    }
    if (fields.empty()) {
        if (error) *error = "message " + messageName + " declares no fields";
        return nullptr;
    }

    std::unordered_set<std::string> seen;
    for (const auto& field : fields) {
        if (!seen.insert(field.name).second) {
            if (error) *error = "duplicate field '" + field.name + "' in " + messageName;
            return nullptr;
        }
    }

    google::protobuf::FileDescriptorProto file;
    file.set_name(messageName + ".proto");
    file.set_package(kRecordPackage);
    file.set_syntax("proto2");

    auto* message = file.add_message_type();
    message->set_name(messageName);
    int number = 1;
    for (const auto& field : fields) {
        auto* fieldProto = message->add_field();
        fieldProto->set_name(field.name);
        fieldProto->set_number(number++);
        fieldProto->set_label(FieldDescriptorProto::LABEL_OPTIONAL);
        fieldProto->set_type(protoType(field.type));
    }

    std::unique_ptr<RecordSchema> schema(new RecordSchema(messageName, fields));

    CollectingErrors collector;
    const auto* built = schema->pool_->BuildFileCollectingErrors(file, &collector);
    if (built == nullptr) {
        if (error) *error = "invalid schema for " + messageName + ": " + collector.errors;
        return nullptr;
    }

    schema->descriptor_ = built->message_type(0);
    schema->factory_ = std::make_unique<google::protobuf::DynamicMessageFactory>(schema->pool_.get());
    schema->prototype_ = schema->factory_->GetPrototype(schema->descriptor_);

    google::protobuf::DescriptorProto descriptorProto;
    schema->descriptor_->CopyTo(&descriptorProto);
    descriptorProto.SerializeToString(&schema->descriptorBytes_);

    LOG_DEBUG("RecordSchema", "Built {} with {} fields", schema->descriptor_->full_name(),
              fields.size());
    return schema;
}

// =============================================================================
// Encode / Decode
// =============================================================================

EncodeResult RecordSchema::encode(const google::protobuf::Struct& record) const {
    EncodeResult result;

    std::unique_ptr<Message> message(prototype_->New());
    const Reflection* reflection = message->GetReflection();

    for (size_t i = 0; i < fields_.size(); ++i) {
        const FieldDef& def = fields_[i];
        const FieldDescriptor* field = descriptor_->field(static_cast<int>(i));

        auto it = record.fields().find(def.name);
        if (it == record.fields().end() || it->second.kind_case() == Value::kNullValue) {
            result.errors.push_back("missing required field '" + def.name + "'");
            continue;
        }
        const Value& value = it->second;

        auto mismatch = [&]() {
            result.errors.push_back("field '" + def.name + "' expects " +
                                    fieldTypeToString(def.type) + ", got " + kindName(value));
        };

        switch (def.type) {
            case FieldType::STRING:
                if (value.kind_case() != Value::kStringValue) {
                    mismatch();
                    break;
                }
                reflection->SetString(message.get(), field, value.string_value());
                break;

            case FieldType::INT32:
            case FieldType::INT64: {
                if (value.kind_case() != Value::kNumberValue) {
                    mismatch();
                    break;
                }
                double number = value.number_value();
                if (!isIntegral(number)) {
                    result.errors.push_back("field '" + def.name + "' expects an integer");
                    break;
                }
                if (def.type == FieldType::INT32) {
                    if (number < static_cast<double>(std::numeric_limits<int32_t>::min()) ||
                        number > static_cast<double>(std::numeric_limits<int32_t>::max())) {
                        result.errors.push_back("field '" + def.name + "' is out of int32 range");
                        break;
                    }
                    reflection->SetInt32(message.get(), field, static_cast<int32_t>(number));
                } else {
                    // 2^63 is exactly representable; anything at or above it overflows
                    if (number < -9223372036854775808.0 || number >= 9223372036854775808.0) {
                        result.errors.push_back("field '" + def.name + "' is out of int64 range");
                        break;
                    }
                    reflection->SetInt64(message.get(), field, static_cast<int64_t>(number));
                }
                break;
            }

            case FieldType::FLOAT: {
                if (value.kind_case() != Value::kNumberValue) {
                    mismatch();
                    break;
                }
                double number = value.number_value();
                if (std::fabs(number) > static_cast<double>(std::numeric_limits<float>::max())) {
                    result.errors.push_back("field '" + def.name + "' is out of float range");
                    break;
                }
                reflection->SetFloat(message.get(), field, static_cast<float>(number));
                break;
            }

            case FieldType::DOUBLE:
                if (value.kind_case() != Value::kNumberValue) {
                    mismatch();
                    break;
                }
                reflection->SetDouble(message.get(), field, value.number_value());
                break;

            case FieldType::BOOL:
                if (value.kind_case() != Value::kBoolValue) {
                    mismatch();
                    break;
                }
                reflection->SetBool(message.get(), field, value.bool_value());
                break;
        }
    }

    if (!result.errors.empty()) {
        for (const auto& error : result.errors) {
            if (!result.error_message.empty()) {
                result.error_message += "; ";
            }
            result.error_message += error;
        }
        return result;
    }

    if (!message->SerializeToString(&result.payload)) {
        result.error_message = "failed to serialize " + messageName_;
        result.errors.push_back(result.error_message);
        return result;
    }

    result.success = true;
    return result;
}

bool RecordSchema::decode(const std::string& payload,
                          google::protobuf::Struct* record,
                          std::string* error) const {
    std::unique_ptr<Message> message(prototype_->New());
    if (!message->ParseFromString(payload)) {
        if (error) *error = "payload is not a valid " + messageName_;
        return false;
    }

    const Reflection* reflection = message->GetReflection();
    record->Clear();
    auto& out = *record->mutable_fields();

    for (size_t i = 0; i < fields_.size(); ++i) {
        const FieldDescriptor* field = descriptor_->field(static_cast<int>(i));
        if (!reflection->HasField(*message, field)) {
            continue;
        }

        Value& value = out[fields_[i].name];
        switch (fields_[i].type) {
            case FieldType::STRING:
                value.set_string_value(reflection->GetString(*message, field));
                break;
            case FieldType::INT32:
                value.set_number_value(reflection->GetInt32(*message, field));
                break;
            case FieldType::INT64:
                value.set_number_value(static_cast<double>(reflection->GetInt64(*message, field)));
                break;
            case FieldType::FLOAT:
                value.set_number_value(reflection->GetFloat(*message, field));
                break;
            case FieldType::DOUBLE:
                value.set_number_value(reflection->GetDouble(*message, field));
                break;
            case FieldType::BOOL:
                value.set_bool_value(reflection->GetBool(*message, field));
                break;
        }
    }
    return true;
}

}  // namespace schema
}  // namespace ingestd
