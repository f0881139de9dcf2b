/*
taxfilter-tk filters sequence records by their NCBI taxonomic lineage.

Copyright (C) 2010 Johannes Dröge

This program is free software: you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License
along with this program.  If not, see <http://www.gnu.org/licenses/>.

*/


#ifndef lineageformat_hh_
#define lineageformat_hh_

#include <string>
#include "taxonomyinterface.hh"



// IDs from the node up to the root joined by delimiter, each written as "name (ID)" if show_names is set
std::string formatLineage( const TaxonomyInterface& taxinter, const TaxonNode* node, const bool show_names, const std::string& delimiter );

// "<distance>\t<name of the lowest common ancestor>"
std::string formatCommonAncestorDistance( const TaxonomyInterface& taxinter, const TaxonNode* A, const TaxonNode* B, const bool only_canonical );

#endif // lineageformat_hh_
