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

#ifndef accessconv_hh_
#define accessconv_hh_

#include <string>
#include <istream>
#include <unordered_map>
#include "types.hh"



// RefSeq accession classes
enum class AccessionClass {
    curated,
    predicted,
    other
};

AccessionClass classifyAccession( const std::string& accession );

// accession of a FASTA header: first word, or the field after "ref" for db|acc| style identifiers
std::string extractAccession( const std::string& header );

// species name in the last [...] of a FASTA header, empty if there is none
std::string extractBracketedName( const std::string& header );



// converts from access identifier to taxonomic id
class StrIDConverter {
public:
    virtual ~StrIDConverter() {};
    virtual TaxonID operator[]( const std::string& acc ) const = 0; // throws TaxonMappingNotFound
    virtual bool contains( const std::string& acc ) const = 0;
};



// Two-column "accession<TAB>taxid" files, or NCBI accession2taxid files with their
// "accession<TAB>accession.version<TAB>taxid<TAB>gi" header. Lookups fall back to the
// accession without version suffix.
class StrIDConverterFlatfileMemory : public StrIDConverter {
public:
    StrIDConverterFlatfileMemory( const std::string& flatfile_filename );
    StrIDConverterFlatfileMemory( std::istream& flatfile, const std::string& name = "<stream>" );

    TaxonID operator[]( const std::string& acc ) const;
    bool contains( const std::string& acc ) const;
    std::size_t size() const { return accessidconv_.size(); }

private:
    void parse( std::istream& flatfile );
    const TaxonID* find( const std::string& acc ) const;

    std::unordered_map< std::string, TaxonID > accessidconv_;
    const std::string filename_;
};



StrIDConverter* loadStrIDConverterFromFile( const std::string& filename );

#endif // accessconv_hh_
