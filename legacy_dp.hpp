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

#ifndef PAIRALIGN_LEGACY_DP__HPP
#define PAIRALIGN_LEGACY_DP__HPP

#include <string>

#include "scoring_matrix.hpp"
#include "cigar.hpp"

using namespace std;
namespace PairAlign {

// Single score matrix with a remembered direction per cell. A gap is charged gapextend only if
// the neighbour it extends was itself reached by a gap in the same orientation, otherwise gopen.
// Approximates affine gaps; kept to reproduce results of older releases.

struct SLegacyAlign {
    CCigar m_cigar;
    TScore m_score;
};

//Needleman-Wunsch
SLegacyAlign LegacyGlbAlign(const string& a, const string& b, TScore gopen, TScore gapextend, const CScoringMatrix& delta);

//Smith-Waterman; empty cigar and zero score if no cell scores above 0
SLegacyAlign LegacyLclAlign(const string& a, const string& b, TScore gopen, TScore gapextend, const CScoringMatrix& delta);

}; // namespace

#endif  // PAIRALIGN_LEGACY_DP__HPP
