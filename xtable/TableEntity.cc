// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#include "TableEntity.hh"

using namespace xtable;

void
TableEntity::ReadEntity(const PropertyMap & properties)
{
	_properties = properties;
}

PropertyMap
TableEntity::WriteEntity() const
{
	return _properties;
}

// vim: se sw=8 :
