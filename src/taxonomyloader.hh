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

#ifndef taxonomyloader_hh_
#define taxonomyloader_hh_

#include <string>
#include "taxontree.hh"



// where the tools take their taxonomy from, empty members are unset
struct TaxonomySource {
	std::string db_filename;
	std::string taxdir;
	std::string tax_prefix;
};



// TAXFILTER_TAXONOMY_DB if set, else the default database name
std::string defaultTaxonomyDBFilename();



// Order of precedence: dump files in taxdir, an explicit database, the default
// database if it exists, the dump folder named by TAXFILTER_TAXONOMY_NCBI.
// Throws FileNotFound if none of these is available.
Taxonomy* loadTaxonomy( const TaxonomySource& source );

#endif // taxonomyloader_hh_
