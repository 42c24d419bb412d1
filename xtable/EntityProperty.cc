// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#include "EntityProperty.hh"
#include "XTableException.hh"

#include <sstream>
#include <cpprest/asyncrt_utils.h>

namespace xtable
{

static const std::pair<EdmType, const char *> edmNames[] = {
	{ EdmType::String, "Edm.String" },
	{ EdmType::Binary, "Edm.Binary" },
	{ EdmType::Boolean, "Edm.Boolean" },
	{ EdmType::DateTime, "Edm.DateTime" },
	{ EdmType::Double, "Edm.Double" },
	{ EdmType::Guid, "Edm.Guid" },
	{ EdmType::Int32, "Edm.Int32" },
	{ EdmType::Int64, "Edm.Int64" }
};

const char *
EdmTypeName(EdmType type)
{
	for (const auto & entry : edmNames) {
		if (entry.first == type) {
			return entry.second;
		}
	}
	return "Edm.Unknown";
}

bool
EdmTypeFromName(const std::string & name, EdmType & type)
{
	for (const auto & entry : edmNames) {
		if (name == entry.second) {
			type = entry.first;
			return true;
		}
	}
	return false;
}

EntityProperty
EntityProperty::Guid(const std::string & v)
{
	EntityProperty prop(v);
	prop._type = EdmType::Guid;
	return prop;
}

EntityProperty
EntityProperty::Null(EdmType type)
{
	EntityProperty prop;
	prop._type = type;
	return prop;
}

void
EntityProperty::Expect(EdmType type) const
{
	if (_type != type) {
		std::ostringstream msg;
		msg << "Property holds " << EdmTypeName(_type) << ", not " << EdmTypeName(type);
		throw XTABLEEXCEPTION(msg.str());
	}
	if (_isNull) {
		throw XTABLEEXCEPTION(std::string("Property of type ") + EdmTypeName(type) + " is null");
	}
}

const std::string &
EntityProperty::AsString() const
{
	Expect(_type == EdmType::Guid ? EdmType::Guid : EdmType::String);
	return boost::get<std::string>(_value);
}

const std::vector<unsigned char> &
EntityProperty::AsBinary() const
{
	Expect(EdmType::Binary);
	return boost::get<std::vector<unsigned char>>(_value);
}

bool
EntityProperty::AsBoolean() const
{
	Expect(EdmType::Boolean);
	return boost::get<bool>(_value);
}

utility::datetime
EntityProperty::AsDateTime() const
{
	Expect(EdmType::DateTime);
	return boost::get<utility::datetime>(_value);
}

double
EntityProperty::AsDouble() const
{
	Expect(EdmType::Double);
	return boost::get<double>(_value);
}

int32_t
EntityProperty::AsInt32() const
{
	Expect(EdmType::Int32);
	return boost::get<int32_t>(_value);
}

int64_t
EntityProperty::AsInt64() const
{
	Expect(EdmType::Int64);
	return boost::get<int64_t>(_value);
}

bool
EntityProperty::operator==(const EntityProperty & that) const
{
	if (_type != that._type || _isNull != that._isNull) {
		return false;
	}
	if (_isNull) {
		return true;
	}
	switch (_type) {
	case EdmType::String:
	case EdmType::Guid:
		return AsString() == that.AsString();
	case EdmType::Binary:
		return AsBinary() == that.AsBinary();
	case EdmType::Boolean:
		return AsBoolean() == that.AsBoolean();
	case EdmType::DateTime:
		return AsDateTime() == that.AsDateTime();
	case EdmType::Double:
		return AsDouble() == that.AsDouble();
	case EdmType::Int32:
		return AsInt32() == that.AsInt32();
	case EdmType::Int64:
		return AsInt64() == that.AsInt64();
	}
	return false;
}

std::string
EntityProperty::ToString() const
{
	if (_isNull) {
		return "null";
	}
	switch (_type) {
	case EdmType::String:
	case EdmType::Guid:
		return AsString();
	case EdmType::Binary:
		return utility::conversions::to_base64(AsBinary());
	case EdmType::Boolean:
		return AsBoolean() ? "true" : "false";
	case EdmType::DateTime:
		return AsDateTime().to_string(utility::datetime::ISO_8601);
	case EdmType::Double:
		{
			std::ostringstream strm;
			strm.precision(17);
			strm << AsDouble();
			return strm.str();
		}
	case EdmType::Int32:
		return std::to_string(AsInt32());
	case EdmType::Int64:
		return std::to_string(AsInt64());
	}
	return std::string();
}

std::ostream&
operator<<(std::ostream& os, const EntityProperty& prop)
{
	os << EdmTypeName(prop._type) << "(" << prop.ToString() << ")";
	return os;
}

}

// vim: se sw=8 :
