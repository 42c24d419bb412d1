// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#pragma once
#ifndef _ENTITYPROPERTY_HH_
#define _ENTITYPROPERTY_HH_

#include <cstdint>
#include <iostream>
#include <map>
#include <string>
#include <vector>
#include <boost/variant.hpp>
#include <cpprest/asyncrt_utils.h>

namespace xtable
{

enum class EdmType { String, Binary, Boolean, DateTime, Double, Guid, Int32, Int64 };

/// Wire name of the type as used in "@odata.type" annotations, e.g. "Edm.Int64".
const char * EdmTypeName(EdmType type);

/// Inverse of EdmTypeName. Returns false for names it doesn't know.
bool EdmTypeFromName(const std::string & name, EdmType & type);

// A single typed property value of a table entity. A property may be null; a null
// property still has a type. Accessors throw XTableException when asked for a type
// other than the one held, or when the property is null.
class EntityProperty
{
	friend std::ostream& operator<<(std::ostream& os, const EntityProperty& prop);

public:
	EntityProperty() : _type(EdmType::String), _isNull(true) {}
	EntityProperty(const std::string & v) : _type(EdmType::String), _isNull(false), _value(v) {}
	EntityProperty(const char * v) : _type(EdmType::String), _isNull(false), _value(std::string(v)) {}
	EntityProperty(const std::vector<unsigned char> & v) : _type(EdmType::Binary), _isNull(false), _value(v) {}
	EntityProperty(bool v) : _type(EdmType::Boolean), _isNull(false), _value(v) {}
	EntityProperty(utility::datetime v) : _type(EdmType::DateTime), _isNull(false), _value(v) {}
	EntityProperty(double v) : _type(EdmType::Double), _isNull(false), _value(v) {}
	EntityProperty(int32_t v) : _type(EdmType::Int32), _isNull(false), _value(v) {}
	EntityProperty(int64_t v) : _type(EdmType::Int64), _isNull(false), _value(v) {}

	static EntityProperty Guid(const std::string & v);
	static EntityProperty Null(EdmType type);

	EdmType Type() const { return _type; }
	bool IsNull() const { return _isNull; }

	const std::string & AsString() const;	// String and Guid
	const std::vector<unsigned char> & AsBinary() const;
	bool AsBoolean() const;
	utility::datetime AsDateTime() const;
	double AsDouble() const;
	int32_t AsInt32() const;
	int64_t AsInt64() const;

	bool operator==(const EntityProperty & that) const;
	bool operator!=(const EntityProperty & that) const { return !(*this == that); }

	std::string ToString() const;

private:
	typedef boost::variant<std::string, std::vector<unsigned char>, bool, utility::datetime, double, int32_t, int64_t> value_t;

	EdmType _type;
	bool _isNull;
	value_t _value;

	void Expect(EdmType type) const;
};

std::ostream& operator<<(std::ostream& os, const EntityProperty& prop);

typedef std::map<std::string, EntityProperty> PropertyMap;

}

#endif // _ENTITYPROPERTY_HH_

// vim: se sw=8 :
