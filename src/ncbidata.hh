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

#ifndef ncbidata_hh_
#define ncbidata_hh_

#include <istream>
#include <string>
#include "nodestore.hh"
#include "taxontree.hh"



// Reads nodes.dmp and names.dmp into a node store. A node whose parent is itself is the
// root. Names are the scientific names, or NCBI's unique name variant where one is given.
// Throws ParsingError, DuplicateId or DuplicateName.
NodeStore parseNCBIDump( std::istream& nodes, std::istream& names, const std::string& nodes_name = "nodes.dmp", const std::string& names_name = "names.dmp" );



// additionally runs the ancestry indexer, MalformedTaxonomy for dangling parents or cycles
Taxonomy* parseNCBIFlatFiles( const std::string& nodes_filename, const std::string& names_filename );



// <dir>/<prefix>nodes.dmp and <dir>/<prefix>names.dmp, FileNotFound if one is missing
Taxonomy* loadTaxonomyFromDirectory( const std::string& ncbi_root_folder, const std::string& prefix = "" );



// dump folder taken from the environment, NULL if the variable is not set
Taxonomy* loadTaxonomyFromEnvironment( const std::string& prefix = "" );

#endif // ncbidata_hh_
