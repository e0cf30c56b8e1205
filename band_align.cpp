/*===========================================================================
*
*                            PUBLIC DOMAIN NOTICE
*               National Center for Biotechnology Information
*
*  This software/database is a "United States Government Work" under the
*  terms of the United States Copyright Act.  It was written as part of
*  the author's official duties as a United States Government employee and
*  thus cannot be copyrighted.  This software/database is freely available
*  to the public for use. The National Library of Medicine and the U.S.
*  Government have not placed any restriction on its use or reproduction.
*
*  Although all reasonable efforts have been taken to ensure the accuracy
*  and reliability of the software and data, the NLM and the U.S.
*  Government do not and cannot warrant the performance or results that
*  may be obtained by using this software or data. The NLM and the U.S.
*  Government disclaim all warranties, express or implied, including
*  warranties of performance, merchantability or fitness for any particular
*  purpose.
*
*  Please cite the author in any work or product based on this material.
*
* ===========================================================================
*
*/

#include <cstdlib>

#include "aligners.hpp"
#include "affine_dp.hpp"
#include "align_exception.hpp"

using namespace std;
namespace PairAlign {

SAlignmentResult CBandedAligner::DoAlign(const string& seq1, const string& seq2, const SAlignmentOptions& options) const {
    string a;
    string b;
    PrepareAndValidate(seq1, seq2, options, a, b);
    int band = options.m_bandwidth;
    if(band < 0)
        throw CAlignException(CAlignException::eBandConstraint, "bandwidth must be non-negative");
    const CScoringMatrix& delta = options.Matrix();
    int na = a.size();
    int nb = b.size();
    int diff = abs(na-nb);
    if(diff > band)
        throw CAlignException(CAlignException::eBandConstraint, "Sequence length difference ("+to_string(diff)+") exceeds bandwidth ("+to_string(band)+"). Increase bandwidth or use standard alignment.");

    TScore score;
    CCigar cigar = BandAlign(a, b, options.m_gap_open, options.m_gap_extend, delta, band, score);
    return MakeResult(cigar, a, b, score, options.m_score_normalize, 0, 0, na, nb);
}

}; // namespace
