// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#include "TableResult.hh"

using namespace xtable;

void
TableResult::UpdateResultObject(TableEntity & entity) const
{
	if (!_etag.empty()) {
		entity.SetEtag(_etag);
	}
}

// vim: se sw=8 :
