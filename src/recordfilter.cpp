#include "recordfilter.hh"
#include <iostream>
#include "exception.hh"



bool FastaRecordFilter::operator()( const SequenceRecord& rec ) {
	++stats_.total;
	const std::string accession = extractAccession( rec.id );

	const AccessionClass accclass = classifyAccession( accession );
	if( ( options_.exclude_curated && accclass == AccessionClass::curated ) || ( options_.exclude_predicted && accclass == AccessionClass::predicted ) ) {
		++stats_.excluded;
		return false;
	}

	const TaxonNode* node = resolve( rec.id, accession );
	if( ! node ) {
		++stats_.unresolved;
		return false;
	}

	if( filter_( node ) ) {
		++stats_.accepted;
		return true;
	}
	++stats_.rejected;
	return false;
}



const TaxonNode* FastaRecordFilter::resolve( const std::string& header, const std::string& accession ) const {
	const TaxonomyInterface& taxinter = filter_.getTaxonomy();
	if( seqid2taxid_ ) {
		if( ! seqid2taxid_->contains( accession ) ) return NULL;
		const TaxonID taxid = ( *seqid2taxid_ )[ accession ];
		if( ! taxinter.containsId( taxid ) ) return NULL;
		return taxinter.getNode( taxid );
	}

	const std::string name = extractBracketedName( header );
	if( name.empty() || ! taxinter.containsName( name ) ) return NULL;
	return taxinter.getNode( name );
}



bool FastqRecordFilter::operator()( const SequenceRecord& rec ) {
	++stats_.total;
	const ReadAssignment* assignment = report_.find( rec.id );

	if( ! assignment ) {
		const std::string read_id = normalizeReadId( rec.id );
		if( options_.unmapped == UnmappedReadPolicy::strict ) BOOST_THROW_EXCEPTION( UnmappedRead{} << seqid_info{ read_id } );
		std::cerr << "Read '" << read_id << "' not found in classification report, skipping..." << std::endl;
		++stats_.unmapped;
		return false;
	}

	if( assignment->accepted ) {
		++stats_.accepted;
		return true;
	}
	++stats_.rejected;
	return false;
}
