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

#ifndef descendantfilter_hh_
#define descendantfilter_hh_

#include <string>
#include "types.hh"
#include "taxonomyinterface.hh"



// Membership test for the subtree below a fixed ancestor. A node belongs to it if
// it is the ancestor itself or its ancestry path starts with ancestry(ancestor) + [ancestor].
// Resolving the ancestor throws TaxonNotFound, so a filter never exists for an unknown taxon.
class DescendantFilter {
	public:
		DescendantFilter( const TaxonomyInterface& taxinter, const TaxonID ancestor_taxid );
		DescendantFilter( const TaxonomyInterface& taxinter, const std::string& ancestor_name );

		bool isDescendantOrSelf( const TaxonNode* node ) const;

		// throws TaxonNotFound for taxids missing in the taxonomy
		bool isDescendantOrSelf( const TaxonID taxid ) const;

		bool operator()( const TaxonNode* node ) const { return isDescendantOrSelf( node ); }
		bool operator()( const TaxonID taxid ) const { return isDescendantOrSelf( taxid ); }

		const TaxonNode* getAncestor() const { return ancestor_; }
		const TaxonomyInterface& getTaxonomy() const { return taxinter_; }

	private:
		void setPrefix();

		const TaxonomyInterface& taxinter_;
		const TaxonNode* const ancestor_;
		AncestryPath prefix_;
};

#endif // descendantfilter_hh_
