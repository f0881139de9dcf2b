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

#ifndef nodestore_hh_
#define nodestore_hh_

#include "types.hh"
#include <boost/optional.hpp>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>



class TaxonNode {
	public:
		TaxonNode( TaxonID id, const std::string& taxonname, const std::string& rankname, const boost::optional< TaxonID >& parent, std::size_t position ) :
			taxid( id ),
			name( taxonname ),
			rank( rankname ),
			parent_taxid( parent ),
			pos( position ),
			parent_pos( position ),
			root_pathlength( 0 ) {};

		bool isRoot() const { return ! parent_taxid; };

		TaxonID taxid;
		std::string name;
		const std::string& rank; //internal rank string owned by the store
		boost::optional< TaxonID > parent_taxid; //not set for the root only
		std::size_t pos; //position in the store
		std::size_t parent_pos; //set by the ancestry indexer
		AncestryPath ancestry; //set by the ancestry indexer
		large_unsigned_int root_pathlength; //equals ancestry.size()
};



// holds all taxon nodes and the id and name indices, in lockstep
class NodeStore {
	friend class TaxonTree;
	public:
		typedef std::vector< TaxonNode >::const_iterator const_iterator;

		NodeStore() {};

		// nodes refer to the rank strings of their store, so a store can only be moved
		NodeStore( NodeStore&& ) = default;
		NodeStore( const NodeStore& ) = delete;
		NodeStore& operator=( const NodeStore& ) = delete;

		// throws DuplicateId or DuplicateName and leaves the store untouched in that case
		void insert( TaxonID taxid, const std::string& name, const std::string& rank, const boost::optional< TaxonID >& parent_taxid );

		const TaxonNode& lookupById( TaxonID taxid ) const;
		const TaxonNode& lookupByName( const std::string& name ) const;

		// NULL if absent
		const TaxonNode* findById( TaxonID taxid ) const;
		const TaxonNode* findByName( const std::string& name ) const;

		bool containsId( TaxonID taxid ) const { return id2pos_.count( taxid ); };
		bool containsName( const std::string& name ) const { return name2pos_.count( name ); };

		std::size_t size() const { return nodes_.size(); };
		bool empty() const { return nodes_.empty(); };
		const_iterator begin() const { return nodes_.begin(); };
		const_iterator end() const { return nodes_.end(); };

		const std::string& insertRankInternal( const std::string& rankname );
		const std::string* getRankInternal( const std::string& rankname ) const;

	private:
		std::vector< TaxonNode > nodes_;
		std::unordered_map< TaxonID, std::size_t > id2pos_;
		std::unordered_map< std::string, std::size_t > name2pos_;
		std::set< std::string > ranks_;
};

#endif // nodestore_hh_
