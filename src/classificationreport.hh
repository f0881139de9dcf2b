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

#ifndef classificationreport_hh_
#define classificationreport_hh_

#include <istream>
#include <string>
#include <unordered_map>
#include <vector>
#include "types.hh"
#include "descendantfilter.hh"



enum class ReportFormat {
    kraken2,
    centrifuge
};



struct ReadAssignment {
    TaxonID taxid; // 0 for unclassified reads
    large_unsigned_int score;
    bool accepted; // taxon lies below the filter ancestor
};



struct ReportStats {
    ReportStats() : entries( 0 ), unclassified( 0 ), unknown_taxa( 0 ) {}
    large_unsigned_int entries;
    large_unsigned_int unclassified;
    large_unsigned_int unknown_taxa;
};



// read identifier without description and without a /1 or /2 mate suffix
std::string normalizeReadId( const std::string& header );



// Per-read taxon assignments from a Kraken2 or Centrifuge output file, decided
// against a DescendantFilter while loading.
//  Kraken2: a read listed several times (mates) is accepted only if all entries are.
//  Centrifuge: the best scoring entry wins, ties are accepted if any tied entry is.
// Taxids unknown to the taxonomy are counted and rejected.
class ClassificationReport {
public:
    ClassificationReport( const std::string& filename, const ReportFormat format, const DescendantFilter& filter );
    ClassificationReport( std::istream& report, const ReportFormat format, const DescendantFilter& filter, const std::string& name = "<stream>" );

    // NULL if the read is not in the report
    const ReadAssignment* find( const std::string& read_id ) const;

    std::size_t size() const { return reads_.size(); }
    const ReportStats& getStats() const { return stats_; }
    ReportFormat getFormat() const { return format_; }

private:
    void parse( std::istream& report );
    void addKraken2Entry( const std::vector< std::string >& fields );
    void addCentrifugeEntry( const std::vector< std::string >& fields );
    TaxonID parseTaxonID( const std::string& field ) const;
    bool accepts( const TaxonID taxid );

    const ReportFormat format_;
    const DescendantFilter& filter_;
    const std::string filename_;
    uint line_num_;
    ReportStats stats_;
    std::unordered_map< std::string, ReadAssignment > reads_;
};

#endif // classificationreport_hh_
