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

#ifndef taxonomydb_hh_
#define taxonomydb_hh_

#include <string>
#include "taxontree.hh"



// Table layout of the persisted taxonomy; the ancestry column holds the
// '/'-joined ancestor ids from the root down to the parent, NULL for the root.
const std::string taxonomy_db_schema =
    "CREATE TABLE IF NOT EXISTS taxonomy ("
    "id INTEGER PRIMARY KEY, "
    "ancestry TEXT, "
    "name TEXT NOT NULL UNIQUE, "
    "rank TEXT);"
    "CREATE UNIQUE INDEX IF NOT EXISTS taxonomy_name_idx ON taxonomy(name);";



// Writes all nodes in one transaction. The table must be empty; on any failure
// nothing is written. Throws DatabaseError.
void saveTaxonomyToSQLite( const Taxonomy& tax, const std::string& db_filename );



// Rebuilds and re-indexes a taxonomy from the database. Throws FileNotFound,
// DatabaseError, or MalformedTaxonomy if a stored ancestry disagrees with the
// recomputed one.
Taxonomy* loadTaxonomyFromSQLite( const std::string& db_filename );



// number of rows in the taxonomy table, 0 if the table does not exist
large_unsigned_int countTaxonomyRows( const std::string& db_filename );

#endif // taxonomydb_hh_
