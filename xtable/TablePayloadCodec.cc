// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#include <cmath>
#include <limits>
#include <sstream>
#include <boost/lexical_cast.hpp>

#include "TablePayloadCodec.hh"
#include "TableEntity.hh"
#include "OperationContext.hh"
#include "XTableException.hh"
#include "Trace.hh"

using namespace xtable;
using web::json::value;

static bool
IsReservedName(
    const std::string & name
    )
{
    return name == table::c_PartitionKey || name == table::c_RowKey || name == table::c_Timestamp
        || name.compare(0, table::c_ODataPrefix.size(), table::c_ODataPrefix) == 0;
}

static bool
IsAnnotation(
    const std::string & name
    )
{
    auto & suffix = table::c_ODataTypeSuffix;
    return name.size() > suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static value
DoubleToJson(
    double d
    )
{
    if (std::isnan(d)) {
        return value::string("NaN");
    }
    if (std::isinf(d)) {
        return value::string(d > 0 ? "Infinity" : "-Infinity");
    }
    return value::number(d);
}

value
JsonPayloadCodec::ToJson(
    const std::string & name,
    const EntityProperty & prop
    )
{
    switch (prop.Type()) {
        case EdmType::String:
        case EdmType::Guid:
            return value::string(prop.AsString());
        case EdmType::Binary:
            return value::string(utility::conversions::to_base64(prop.AsBinary()));
        case EdmType::Boolean:
            return value::boolean(prop.AsBoolean());
        case EdmType::DateTime:
            {
                auto dt = prop.AsDateTime();
                if (!dt.is_initialized()) {
                    throw XTABLEEXCEPTION("Property " + name + " holds an uninitialized date");
                }
                return value::string(dt.to_string(utility::datetime::ISO_8601));
            }
        case EdmType::Double:
            return DoubleToJson(prop.AsDouble());
        case EdmType::Int32:
            return value::number(prop.AsInt32());
        case EdmType::Int64:
            // JSON numbers lose precision past 2^53; the service takes Int64 as a string.
            return value::string(std::to_string(prop.AsInt64()));
    }
    throw XTABLEEXCEPTION("Property " + name + " has an unknown type");
}

std::vector<unsigned char>
JsonPayloadCodec::WriteEntity(
    const TableEntity & entity,
    TablePayloadFormat format,
    bool isTableEntry,
    OperationContext & context
    ) const
{
    Trace trace(Trace::Codec, "JsonPayloadCodec::WriteEntity", context.ClientRequestId());

    // Keep insertion order: keys first, then the properties sorted by name.
    value obj = value::object(true);

    if (!isTableEntry) {
        obj[table::c_PartitionKey] = value::string(entity.PartitionKey());
        obj[table::c_RowKey] = value::string(entity.RowKey());
    }

    auto properties = entity.WriteEntity();
    for (const auto & item : properties) {
        const std::string & name = item.first;
        const EntityProperty & prop = item.second;

        if (name.empty()) {
            throw XTABLEEXCEPTION("Entity has a property with an empty name");
        }
        if (IsReservedName(name) || IsAnnotation(name)) {
            throw XTABLEEXCEPTION("Property name " + name + " is reserved");
        }
        if (prop.IsNull()) {
            continue;
        }
        switch (prop.Type()) {
            case EdmType::Binary:
            case EdmType::DateTime:
            case EdmType::Double:
            case EdmType::Guid:
            case EdmType::Int64:
                obj[name + table::c_ODataTypeSuffix] = value::string(EdmTypeName(prop.Type()));
                break;
            default:
                break;
        }
        obj[name] = ToJson(name, prop);
    }

    auto text = obj.serialize();
    TRACEINFO(trace, properties.size() << " properties, " << text.size() << " bytes, format "
              << static_cast<int>(format));
    return std::vector<unsigned char>(text.begin(), text.end());
}

EntityProperty
JsonPayloadCodec::FromJson(
    const std::string & name,
    const value & val,
    const std::string & annotation
    )
{
    if (!annotation.empty()) {
        EdmType type;
        if (!EdmTypeFromName(annotation, type)) {
            throw XTABLEEXCEPTION("Property " + name + " has unknown type " + annotation);
        }
        if (val.is_null()) {
            return EntityProperty::Null(type);
        }
        try {
            switch (type) {
                case EdmType::String:
                    return EntityProperty(val.as_string());
                case EdmType::Guid:
                    return EntityProperty::Guid(val.as_string());
                case EdmType::Binary:
                    return EntityProperty(utility::conversions::from_base64(val.as_string()));
                case EdmType::Boolean:
                    return EntityProperty(val.as_bool());
                case EdmType::DateTime:
                    {
                        auto dt = utility::datetime::from_string(val.as_string(), utility::datetime::ISO_8601);
                        if (!dt.is_initialized()) {
                            throw XTABLEEXCEPTION("Property " + name + " has a malformed date");
                        }
                        return EntityProperty(dt);
                    }
                case EdmType::Double:
                    if (val.is_string()) {
                        const auto & s = val.as_string();
                        if (s == "NaN") {
                            return EntityProperty(std::numeric_limits<double>::quiet_NaN());
                        }
                        if (s == "Infinity") {
                            return EntityProperty(std::numeric_limits<double>::infinity());
                        }
                        if (s == "-Infinity") {
                            return EntityProperty(-std::numeric_limits<double>::infinity());
                        }
                        return EntityProperty(boost::lexical_cast<double>(s));
                    }
                    return EntityProperty(val.as_double());
                case EdmType::Int32:
                    return EntityProperty(static_cast<int32_t>(val.as_integer()));
                case EdmType::Int64:
                    if (val.is_string()) {
                        return EntityProperty(boost::lexical_cast<int64_t>(val.as_string()));
                    }
                    return EntityProperty(static_cast<int64_t>(val.as_number().to_int64()));
            }
        }
        catch (const XTableException &) {
            throw;
        }
        catch (const std::exception & ex) {
            // json_exception, bad_lexical_cast, or a base64 decoding failure
            throw XTABLEEXCEPTION("Property " + name + " does not hold a " + annotation + ": " + ex.what());
        }
    }

    if (val.is_null()) {
        return EntityProperty::Null(EdmType::String);
    }
    if (val.is_string()) {
        return EntityProperty(val.as_string());
    }
    if (val.is_boolean()) {
        return EntityProperty(val.as_bool());
    }
    if (val.is_number()) {
        const auto & number = val.as_number();
        if (number.is_int32()) {
            return EntityProperty(number.to_int32());
        }
        return EntityProperty(number.to_double());
    }
    throw XTABLEEXCEPTION("Property " + name + " is not a scalar");
}

ParsedEntity
JsonPayloadCodec::ReadEntity(
    const std::string & body,
    TablePayloadFormat format,
    OperationContext & context
    ) const
{
    Trace trace(Trace::Codec, "JsonPayloadCodec::ReadEntity", context.ClientRequestId());

    value obj;
    try {
        obj = value::parse(body);
    }
    catch (const web::json::json_exception & ex) {
        throw XTABLEEXCEPTION(std::string("Response body is not valid JSON: ") + ex.what());
    }
    if (!obj.is_object()) {
        throw XTABLEEXCEPTION("Response body is not a JSON object");
    }

    ParsedEntity result;
    const auto & fields = obj.as_object();
    for (const auto & field : fields) {
        const std::string & name = field.first;
        const value & val = field.second;

        if (IsAnnotation(name)) {
            continue;
        }
        if (name == table::c_ODataEtag) {
            if (val.is_string()) {
                result.etag = val.as_string();
            }
            continue;
        }
        if (name.compare(0, table::c_ODataPrefix.size(), table::c_ODataPrefix) == 0) {
            continue;
        }
        if (name == table::c_PartitionKey) {
            result.partitionKey = val.is_string() ? val.as_string() : std::string();
            continue;
        }
        if (name == table::c_RowKey) {
            result.rowKey = val.is_string() ? val.as_string() : std::string();
            continue;
        }
        if (name == table::c_Timestamp) {
            if (val.is_string()) {
                result.timestamp = utility::datetime::from_string(val.as_string(), utility::datetime::ISO_8601);
            }
            continue;
        }

        std::string annotation;
        auto iter = fields.find(name + table::c_ODataTypeSuffix);
        if (iter != fields.end() && iter->second.is_string()) {
            annotation = iter->second.as_string();
        }
        result.properties[name] = FromJson(name, val, annotation);
    }

    TRACEINFO(trace, "Read entity (" << result.partitionKey << "," << result.rowKey << ") with " << result.properties.size() << " properties, format "
              << static_cast<int>(format));
    return result;
}

ServiceError
JsonPayloadCodec::ReadError(
    const std::string & body
    ) const
{
    ServiceError error;
    if (body.empty()) {
        return error;
    }

    try {
        auto obj = value::parse(body);
        if (obj.is_object() && obj.has_field(table::c_ODataError)) {
            const auto & err = obj.at(table::c_ODataError);
            if (err.has_field("code") && err.at("code").is_string()) {
                error.code = err.at("code").as_string();
            }
            if (err.has_field("message")) {
                const auto & msg = err.at("message");
                if (msg.is_string()) {
                    error.message = msg.as_string();
                }
                else if (msg.has_field("value") && msg.at("value").is_string()) {
                    error.message = msg.at("value").as_string();
                }
            }
        }
    }
    catch (const std::exception & ex) {
        Trace trace(Trace::Codec, "JsonPayloadCodec::ReadError");
        TRACEINFO(trace, "Error body is not JSON (" << ex.what() << ")");
        error.message = body.substr(0, 1024);
    }
    return error;
}
