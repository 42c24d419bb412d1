// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#pragma once
#ifndef _TABLERESULT_HH_
#define _TABLERESULT_HH_

#include <memory>
#include <string>
#include "TableEntity.hh"

namespace xtable
{

// Outcome of a single table operation: the HTTP status of the final attempt, the
// entity reflecting the server state (if any) and the entity tag the service reported.
class TableResult
{
public:
	TableResult() : _httpStatusCode(0) {}
	explicit TableResult(int httpStatusCode) : _httpStatusCode(httpStatusCode) {}

	int HttpStatusCode() const { return _httpStatusCode; }
	void SetHttpStatusCode(int code) { _httpStatusCode = code; }

	const std::shared_ptr<TableEntity> & Entity() const { return _entity; }
	void SetEntity(std::shared_ptr<TableEntity> entity) { _entity = std::move(entity); }

	const std::string & Etag() const { return _etag; }
	void SetEtag(std::string etag) { _etag = std::move(etag); }

	// Push this result's entity tag, if it has one, into entity.
	void UpdateResultObject(TableEntity & entity) const;

private:
	int _httpStatusCode;
	std::shared_ptr<TableEntity> _entity;
	std::string _etag;
};

}

#endif // _TABLERESULT_HH_

// vim: se sw=8 :
