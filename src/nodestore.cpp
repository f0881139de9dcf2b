#include "nodestore.hh"
#include "exception.hh"



void NodeStore::insert( TaxonID taxid, const std::string& name, const std::string& rank, const boost::optional< TaxonID >& parent_taxid ) {
	if( id2pos_.count( taxid ) ) BOOST_THROW_EXCEPTION( DuplicateId{} << taxid_info{ taxid } << name_info{ name } );
	if( name2pos_.count( name ) ) BOOST_THROW_EXCEPTION( DuplicateName{} << taxid_info{ taxid } << name_info{ name } );

	const std::size_t pos = nodes_.size();
	nodes_.push_back( TaxonNode( taxid, name, insertRankInternal( rank ), parent_taxid, pos ) );
	id2pos_[ taxid ] = pos;
	name2pos_[ name ] = pos;
}



const TaxonNode& NodeStore::lookupById( TaxonID taxid ) const {
	const TaxonNode* node = findById( taxid );
	if( ! node ) BOOST_THROW_EXCEPTION( TaxonNotFound{} << taxid_info{ taxid } );
	return *node;
}



const TaxonNode& NodeStore::lookupByName( const std::string& name ) const {
	const TaxonNode* node = findByName( name );
	if( ! node ) BOOST_THROW_EXCEPTION( TaxonNotFound{} << name_info{ name } );
	return *node;
}



const TaxonNode* NodeStore::findById( TaxonID taxid ) const {
	std::unordered_map< TaxonID, std::size_t >::const_iterator it = id2pos_.find( taxid );
	if( it == id2pos_.end() ) return NULL;
	return &nodes_[ it->second ];
}



const TaxonNode* NodeStore::findByName( const std::string& name ) const {
	std::unordered_map< std::string, std::size_t >::const_iterator it = name2pos_.find( name );
	if( it == name2pos_.end() ) return NULL;
	return &nodes_[ it->second ];
}



const std::string& NodeStore::insertRankInternal( const std::string& rankname ) {
	return *ranks_.insert( rankname ).first;
}



const std::string* NodeStore::getRankInternal( const std::string& rankname ) const {
	std::set< std::string >::const_iterator rank_it = ranks_.find( rankname );
	if( rank_it == ranks_.end() ) return NULL;
	return &*rank_it;
}
