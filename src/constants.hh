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

#ifndef constants_hh_
#define constants_hh_

#include <string>
#include <vector>

const char tab = '\t';
const std::string tab_as_str = {tab};
const std::string default_field_separator = tab_as_str;
const std::string ncbi_dump_field_separator = "\t|\t";
const char default_comment_symbol = '#';
const char ancestry_separator = '/';
const std::string default_lineage_delimiter = ";";

// canonical ranks (+ superkingdom) as they appear in the NCBI taxonomy
const std::vector< std::string > canonical_ranks = { "superkingdom", "kingdom", "phylum", "class", "order", "family", "genus", "species" };

// RefSeq accession prefixes
const std::vector< std::string > curated_accession_prefixes = { "NC_", "NG_", "NM_", "NP_", "NR_" };
const std::vector< std::string > predicted_accession_prefixes = { "XM_", "XP_", "XR_" };

const unsigned int fasta_line_length = 80;

const std::string ENVVAR_TAXONOMY_NCBI = "TAXFILTER_TAXONOMY_NCBI";
const std::string ENVVAR_TAXONOMY_DB = "TAXFILTER_TAXONOMY_DB";
const std::string default_taxonomy_db = "taxonomy.sqlite3";

const std::string program_version = "1.0.7";

#endif //constants_hh_
