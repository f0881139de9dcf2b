#include "lineageformat.hh"
#include <sstream>
#include "constants.hh"



std::string formatLineage( const TaxonomyInterface& taxinter, const TaxonNode* node, const bool show_names, const std::string& delimiter ) {
	std::ostringstream out;
	const Taxonomy::Lineage lineage = taxinter.getLineage( node );
	for( Taxonomy::PathUpIterator it = lineage.begin(); it != lineage.end(); ++it ) {
		if( it != lineage.begin() ) out << delimiter;
		if( show_names ) out << it->name << " (" << it->taxid << ')';
		else out << it->taxid;
	}
	return out.str();
}



std::string formatCommonAncestorDistance( const TaxonomyInterface& taxinter, const TaxonNode* A, const TaxonNode* B, const bool only_canonical ) {
	std::ostringstream out;
	out << taxinter.getDistance( A, B, only_canonical ) << tab << taxinter.getLCA( A, B )->name;
	return out.str();
}
