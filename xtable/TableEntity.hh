// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#pragma once
#ifndef _TABLEENTITY_HH_
#define _TABLEENTITY_HH_

#include <string>
#include <boost/optional.hpp>
#include <cpprest/asyncrt_utils.h>
#include "EntityProperty.hh"

namespace xtable
{

// TableEntity is a row of a table: the two-part key, the entity tag used for optimistic
// concurrency, the server timestamp and a set of typed properties.
//
// The caller owns the entity. Executing an operation on it updates the entity tag and
// timestamp after a successful write, and (for an insert with echo content) the
// properties. Don't hand the same entity to two operations that run concurrently.
//
// The base class keeps the properties in a dynamic map. A derived class that maps
// its own members overrides ReadEntity/WriteEntity.
class TableEntity
{
public:
	TableEntity() {}
	TableEntity(std::string partitionKey, std::string rowKey)
		: _pkey(std::move(partitionKey)), _rkey(std::move(rowKey)) {}
	virtual ~TableEntity() {}

	// The keys are optional: unset differs from an empty key.
	bool HasPartitionKey() const { return _pkey.is_initialized(); }
	bool HasRowKey() const { return _rkey.is_initialized(); }
	std::string PartitionKey() const { return _pkey.value_or(std::string()); }
	std::string RowKey() const { return _rkey.value_or(std::string()); }
	void SetPartitionKey(std::string pkey) { _pkey = std::move(pkey); }
	void SetRowKey(std::string rkey) { _rkey = std::move(rkey); }

	// Empty means no entity tag.
	const std::string & Etag() const { return _etag; }
	void SetEtag(std::string etag) { _etag = std::move(etag); }

	const utility::datetime & Timestamp() const { return _timestamp; }
	void SetTimestamp(utility::datetime ts) { _timestamp = ts; }

	/// Replace the entity's properties with the ones read from the service.
	virtual void ReadEntity(const PropertyMap & properties);

	/// The properties to send to the service.
	virtual PropertyMap WriteEntity() const;

	PropertyMap & Properties() { return _properties; }
	const PropertyMap & Properties() const { return _properties; }

private:
	boost::optional<std::string> _pkey;
	boost::optional<std::string> _rkey;
	std::string _etag;
	utility::datetime _timestamp;
	PropertyMap _properties;
};

}

#endif // _TABLEENTITY_HH_

// vim: se sw=8 :
