#include "alignmentrecord.hh"



std::ostream& operator<<( std::ostream& strm, const AlignmentRecord& rec ) {
	rec.print( strm );
	return strm;
}
