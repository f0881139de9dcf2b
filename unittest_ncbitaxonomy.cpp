#include <iostream>
#include <cstdlib>
#include <ctime>
#include <vector>
#include <boost/scoped_ptr.hpp>
#include "src/ncbidata.hh"
#include "src/taxonomyinterface.hh"
#include "src/descendantfilter.hh"
#include "src/constants.hh"
#include "src/exception.hh"



// checks a complete NCBI dump from the folder in TAXFILTER_TAXONOMY_NCBI

using namespace std;



const int skip_test = 77; // ctest SKIP_RETURN_CODE



bool unittest_assert( bool condition, const std::string& testname ) {
	if( !condition ) {
		std::cerr << "Test " << testname << " failed!" << std::endl;
	}
	return condition;
}

int main( int argc, char** argv ) {

	if( ! getenv( ENVVAR_TAXONOMY_NCBI.c_str() ) ) {
		cerr << ENVVAR_TAXONOMY_NCBI << " not set, skipping whole dump tests" << endl;
		return skip_test;
	}

	bool alltests = true;

	try {
		boost::scoped_ptr< Taxonomy > tax( loadTaxonomyFromEnvironment() );
		if( ! tax ) return EXIT_FAILURE;
		TaxonomyInterface taxinter( tax.get() );
		const TaxonNode* root_node = taxinter.getRoot();
		const int number_nodes = tax->size();
		cerr << "taxonomy size: " << number_nodes << " nodes" << endl;

		alltests = alltests && unittest_assert( root_node->taxid == 1, "NCBI_ROOT" );
		alltests = alltests && unittest_assert( taxinter.getDepth( root_node ) == 0, "DEPTH_ROOT" );

		// every node: depth matches lineage, lineage ends at the root, parent is one level up
		for( Taxonomy::const_iterator node_it = tax->begin(); node_it != tax->end(); ++node_it ) {
			const TaxonNode* node = &*node_it;
			const Taxonomy::Lineage lineage = taxinter.getLineage( node );
			std::size_t length = 0;
			const TaxonNode* last = NULL;
			for( Taxonomy::PathUpIterator it = lineage.begin(); it != lineage.end(); ++it ) {
				last = &*it;
				++length;
			}
			alltests = alltests && unittest_assert( length == node->root_pathlength + 1, "LINEAGE_LENGTH (" + node->name + ")" );
			alltests = alltests && unittest_assert( last == root_node, "LINEAGE_ENDS_AT_ROOT (" + node->name + ")" );
			if( node != root_node ) {
				alltests = alltests && unittest_assert( taxinter.getParent( node )->root_pathlength + 1 == node->root_pathlength, "PATHLENGTH_TO_PARENT_EQUALS_ONE (" + node->name + ")" );
			}
			alltests = alltests && unittest_assert( taxinter.getNode( node->name ) == node, "NAME_INDEX (" + node->name + ")" );
			if( ! alltests ) return EXIT_FAILURE;
		}

		// pick random pairs and check distance and common ancestor properties
		srand( (unsigned)time( 0 ) );
		for( int i = 0; i < 1000; ++i ) {
			Taxonomy::const_iterator a_it = tax->begin() + rand() % number_nodes;
			Taxonomy::const_iterator b_it = tax->begin() + rand() % number_nodes;
			const TaxonNode* A = &*a_it;
			const TaxonNode* B = &*b_it;
			const TaxonNode* lca = taxinter.getLCA( A, B );

			alltests = alltests && unittest_assert( taxinter.getDistance( A, B ) == taxinter.getDistance( B, A ), "DISTANCE_SYMMETRIC (" + A->name + ", " + B->name + ")" );
			alltests = alltests && unittest_assert( taxinter.getDistance( A, A ) == 0, "DISTANCE_SELF (" + A->name + ")" );
			alltests = alltests && unittest_assert( taxinter.isAncestorOrSelf( lca, A ) && taxinter.isAncestorOrSelf( lca, B ), "LCA_IS_ANCESTOR (" + A->name + ", " + B->name + ")" );

			const std::vector< const TaxonNode* > children = tax->getChildren( *lca );
			for( std::vector< const TaxonNode* >::const_iterator child = children.begin(); child != children.end(); ++child ) {
				alltests = alltests && unittest_assert( ! ( taxinter.isAncestorOrSelf( *child, A ) && taxinter.isAncestorOrSelf( *child, B ) ), "LCA_IS_LOWEST (" + A->name + ", " + B->name + ")" );
			}

			DescendantFilter filter( taxinter, A->taxid );
			alltests = alltests && unittest_assert( filter( A ), "DESCENDANT_OR_SELF (" + A->name + ")" );
		}

		// a few well known lineages
		if( taxinter.containsName( "Homo sapiens" ) && taxinter.containsName( "Mammalia" ) ) {
			alltests = alltests && unittest_assert( taxinter.isDescendant( "Homo sapiens", "Mammalia" ), "HUMAN_IS_MAMMAL" );
			alltests = alltests && unittest_assert( ! taxinter.isDescendant( "Mammalia", "Homo sapiens" ), "MAMMAL_IS_NOT_HUMAN" );
		}
		if( taxinter.containsId( 9606 ) ) {
			alltests = alltests && unittest_assert( taxinter.getName( 9606 ) == "Homo sapiens", "TAXID_9606" );
		}

	} catch( Exception& e ) {
		cerr << "An unrecoverable error occurred: " << e.what() << endl;
		cerr << endl << "Here is some debugging information to locate the problem:" << endl << boost::diagnostic_information( e ) << endl;
		return EXIT_FAILURE;
	}

	if( alltests ) {
		cout << std::endl << "All tests ran through!" << endl;
		return EXIT_SUCCESS;
	}
	cerr << std::endl << "At least one test failed!" << endl;
	return EXIT_FAILURE;
}
