#include "taxontree.hh"
#include "exception.hh"
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <list>
#include <queue>
#include <sstream>
#include <utility>
#include "utils.hh"



TaxonTree::TaxonTree( NodeStore&& nodes ) : nodes_( std::move( nodes ) ), root_pos_( 0 ), max_depth_( 0 ) {
	indexAncestry();
}



std::vector< const TaxonNode* > TaxonTree::getChildren( const TaxonNode& node ) const {
	std::vector< const TaxonNode* > children;
	const std::vector< std::size_t >& positions = children_[ node.pos ];
	children.reserve( positions.size() );
	for( std::vector< std::size_t >::const_iterator it = positions.begin(); it != positions.end(); ++it ) {
		children.push_back( &nodes_.nodes_[ *it ] );
	}
	return children;
}



void TaxonTree::indexAncestry() {
	std::vector< TaxonNode >& nodes = nodes_.nodes_;
	const std::size_t num_nodes = nodes.size();

	// find the single root
	bool root_found = false;
	for( std::size_t pos = 0; pos < num_nodes; ++pos ) {
		if( nodes[ pos ].isRoot() ) {
			if( root_found ) BOOST_THROW_EXCEPTION( MalformedTaxonomy{} << general_info{ "more than one root" } << taxid_info{ nodes[ pos ].taxid } );
			root_pos_ = pos;
			root_found = true;
		}
	}
	if( ! root_found ) BOOST_THROW_EXCEPTION( MalformedTaxonomy{} << general_info{ "no root" } );

	// derived child index; dangling parent references stay unlinked and are reported below
	children_.assign( num_nodes, std::vector< std::size_t >() );
	for( std::size_t pos = 0; pos < num_nodes; ++pos ) {
		TaxonNode& node = nodes[ pos ];
		if( node.isRoot() ) continue;
		const TaxonNode* parent = nodes_.findById( *node.parent_taxid );
		if( parent && parent->pos != pos ) {
			node.parent_pos = parent->pos;
			children_[ parent->pos ].push_back( pos );
		}
	}

	// breadth-first from the root
	std::vector< bool > visited( num_nodes, false );
	std::size_t num_visited = 0;
	std::queue< std::size_t > pending;
	TaxonNode& root = nodes[ root_pos_ ];
	root.ancestry.clear();
	root.root_pathlength = 0;
	root.parent_pos = root_pos_;
	visited[ root_pos_ ] = true;
	++num_visited;
	pending.push( root_pos_ );

	while( ! pending.empty() ) {
		const std::size_t parent_pos = pending.front();
		pending.pop();
		const TaxonNode& parent = nodes[ parent_pos ];
		const std::vector< std::size_t >& children = children_[ parent_pos ];
		for( std::vector< std::size_t >::const_iterator it = children.begin(); it != children.end(); ++it ) {
			if( visited[ *it ] ) continue; //cannot happen in a proper tree
			TaxonNode& child = nodes[ *it ];
			child.ancestry = parent.ancestry;
			child.ancestry.push_back( parent.taxid );
			child.root_pathlength = child.ancestry.size();
			max_depth_ = std::max( max_depth_, child.root_pathlength );
			visited[ *it ] = true;
			++num_visited;
			pending.push( *it );
		}
	}

	if( num_visited != num_nodes ) {
		for( std::size_t pos = 0; pos < num_nodes; ++pos ) {
			if( ! visited[ pos ] ) {
				const TaxonNode& node = nodes[ pos ];
				BOOST_THROW_EXCEPTION( MalformedTaxonomy{} << general_info{ "taxon is not connected to the root" } << taxid_info{ node.taxid } << name_info{ node.name } );
			}
		}
	}
}



std::string encodeAncestry( const AncestryPath& path ) {
	std::ostringstream buffer;
	for( AncestryPath::const_iterator it = path.begin(); it != path.end(); ++it ) {
		if( it != path.begin() ) buffer << ancestry_separator;
		buffer << *it;
	}
	return buffer.str();
}



AncestryPath decodeAncestry( const std::string& encoded ) {
	AncestryPath path;
	if( encoded.empty() ) return path;

	std::list< std::string > fields;
	tokenizeSingleCharDelim( encoded, fields, std::string( 1, ancestry_separator ) );
	for( std::list< std::string >::const_iterator it = fields.begin(); it != fields.end(); ++it ) {
		if( it->empty() ) continue; //trailing rest of the tokenizer
		try {
			path.push_back( boost::lexical_cast< TaxonID >( *it ) );
		} catch( const boost::bad_lexical_cast& ) {
			BOOST_THROW_EXCEPTION( ParsingError{} << general_info{ "bad ancestry string '" + encoded + "'" } );
		}
	}
	return path;
}
