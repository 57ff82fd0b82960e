#include "lineageconsensus.hh"
#include "exception.hh"
#include <algorithm>
#include <cmath>



void ConsensusParameters::validate() const {
    if( ! ( margin >= 0. && margin < 1. ) ) BOOST_THROW_EXCEPTION( ConfigurationError() << option_info( "margin" ) << general_info( "must be in [0,1)" ) );
    if( ! ( identity_exponent >= 0. ) ) BOOST_THROW_EXCEPTION( ConfigurationError() << option_info( "identity-exponent" ) << general_info( "must not be negative" ) );
    if( ! ( coverage_exponent >= 0. ) ) BOOST_THROW_EXCEPTION( ConfigurationError() << option_info( "coverage-exponent" ) << general_info( "must not be negative" ) );
    if( ! ( mapq_weight >= 0. && mapq_weight <= 1. ) ) BOOST_THROW_EXCEPTION( ConfigurationError() << option_info( "mapq-weight" ) << general_info( "must be in [0,1]" ) );
    if( mapq_cap < 1 || mapq_cap >= mapq_unavailable ) BOOST_THROW_EXCEPTION( ConfigurationError() << option_info( "mapq-cap" ) << general_info( "must be in [1,254]" ) );
}



double scoreAlignment( const AlignmentRecord& rec, const ConsensusParameters& params ) {
    double score = std::pow( rec.getIdentity(), double( params.identity_exponent ) ) * std::pow( rec.getCoverage(), double( params.coverage_exponent ) );
    if( rec.hasMappingQuality() ) {
        const double mapq = std::min( rec.getMappingQuality(), params.mapq_cap );
        score *= 1. - params.mapq_weight + params.mapq_weight*mapq/params.mapq_cap;
    }
    return score;
}



void QueryHits::add( const TaxonNode* node, double score, const std::string& target ) {
    const TaxonHit hit( node, score, target );
    std::pair< container_type::iterator, bool > ins = hits_.insert( std::make_pair( node->data->taxid, hit ) );
    if( ! ins.second && betterHit( hit, ins.first->second ) ) ins.first->second = hit;
}



std::vector< TaxonHit > QueryHits::ranked() const {
    std::vector< TaxonHit > result;
    result.reserve( hits_.size() );
    for( container_type::const_iterator it = hits_.begin(); it != hits_.end(); ++it ) result.push_back( it->second );
    std::sort( result.begin(), result.end(), betterHit );
    return result;
}



void LineageConsensus::resolve( const QueryHits& hits, ClassificationRecord& rec, std::ostream& logsink ) const {
    logsink << "ID" << tab << rec.getQueryIdentifier() << endline;
    logsink << "  NUMREC" << tab << hits.numRecords() << endline;
    logsink << "  NUMTAX" << tab << hits.size() << endline;

    if( hits.empty() ) {
        logsink << "  UNRESOLVED" << tab << "no usable hits" << endline << endline;
        rec.setUnclassified();
        return;
    }

    const std::vector< TaxonHit > ranked = hits.ranked();
    const TaxonHit& top = ranked.front();
    logsink << "  TOP" << tab << top.node->data->taxid << tab << top.target << tab << top.score << endline;

    if( taxinter_.getRankedDepth( top.node ) == 0 ) {
        logsink << "  UNRESOLVED" << tab << "best taxon has no ranked ancestor" << endline << endline;
        rec.setUnclassified();
        return;
    }

    // relative distance of the runner-up decides between direct assignment and LCA
    bool direct = ranked.size() == 1;
    if( ! direct && top.score > 0. ) direct = ( top.score - ranked[1].score )/top.score > params_.margin;

    if( direct ) {
        const TaxonNode* node = taxinter_.getRankedAncestor( top.node );
        rec.setAssignment( node, top.score );
        logsink << "  DIRECT" << tab << node->data->taxid << tab << node->data->rank << endline << endline;
        return;
    }

    std::vector< const TaxonNode* > contenders;
    for( std::vector< TaxonHit >::const_iterator it = ranked.begin(); it != ranked.end(); ++it ) {
        if( top.score > 0. && ( top.score - it->score )/top.score > params_.margin ) break;
        contenders.push_back( it->node );
    }

    const TaxonNode* lca = taxinter_.getLCA( contenders );
    const TaxonNode* node = taxinter_.getRankedAncestor( lca );
    logsink << "  LCA" << tab << contenders.size() << tab << lca->data->taxid << endline;
    if( ! node ) {
        logsink << "  UNRESOLVED" << tab << "common ancestor has no ranked ancestor" << endline << endline;
        rec.setUnclassified();
        return;
    }

    const float confidence = top.score*taxinter_.getRankedDepth( lca )/float( taxinter_.getRankedDepth( top.node ) );
    rec.setAssignment( node, confidence );
    logsink << "  CONSENSUS" << tab << node->data->taxid << tab << node->data->rank << tab << confidence << endline << endline;
}
