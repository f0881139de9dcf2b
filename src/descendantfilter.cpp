#include "descendantfilter.hh"
#include <algorithm>



DescendantFilter::DescendantFilter( const TaxonomyInterface& taxinter, const TaxonID ancestor_taxid ) :
	taxinter_( taxinter ),
	ancestor_( taxinter.getNode( ancestor_taxid ) ) {
	setPrefix();
}



DescendantFilter::DescendantFilter( const TaxonomyInterface& taxinter, const std::string& ancestor_name ) :
	taxinter_( taxinter ),
	ancestor_( taxinter.getNode( ancestor_name ) ) {
	setPrefix();
}



void DescendantFilter::setPrefix() {
	prefix_ = ancestor_->ancestry;
	prefix_.push_back( ancestor_->taxid );
}



bool DescendantFilter::isDescendantOrSelf( const TaxonNode* node ) const {
	if( node->taxid == ancestor_->taxid ) return true;
	const AncestryPath& path = node->ancestry;
	return path.size() >= prefix_.size() && std::equal( prefix_.begin(), prefix_.end(), path.begin() );
}



bool DescendantFilter::isDescendantOrSelf( const TaxonID taxid ) const {
	return isDescendantOrSelf( taxinter_.getNode( taxid ) );
}
