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

#include "aligners.hpp"
#include "affine_dp.hpp"
#include "legacy_dp.hpp"

using namespace std;
namespace PairAlign {

SAlignmentResult CGlobalAligner::DoAlign(const string& seq1, const string& seq2, const SAlignmentOptions& options) const {
    string a;
    string b;
    ValidateAndPrepare(seq1, seq2, options, a, b);
    const CScoringMatrix& delta = options.Matrix();
    int na = a.size();
    int nb = b.size();

    if(options.m_gap_model == eDirectionRemembered) {
        SLegacyAlign legacy = LegacyGlbAlign(a, b, options.m_gap_open, options.m_gap_extend, delta);
        return MakeResult(legacy.m_cigar, a, b, legacy.m_score, options.m_score_normalize, 0, 0, na, nb);
    }

    SAffineMatrix dp;
    AffineFill(a, b, options.m_gap_open, options.m_gap_extend, delta, SAffineEnds(), dp);
    CCigar cigar = BackTrack(dp, na, nb, nb);
    return MakeResult(cigar, a, b, dp.m_last_row[nb], options.m_score_normalize, 0, 0, na, nb);
}

SAlignmentResult CLocalAligner::DoAlign(const string& seq1, const string& seq2, const SAlignmentOptions& options) const {
    string a;
    string b;
    ValidateAndPrepare(seq1, seq2, options, a, b);
    const CScoringMatrix& delta = options.Matrix();

    CCigar cigar;
    TScore score;
    if(options.m_gap_model == eDirectionRemembered) {
        SLegacyAlign legacy = LegacyLclAlign(a, b, options.m_gap_open, options.m_gap_extend, delta);
        cigar = legacy.m_cigar;
        score = legacy.m_score;
    } else {
        SAffineMatrix dp;
        AffineFill(a, b, options.m_gap_open, options.m_gap_extend, delta, SAffineEnds(true, true, true), dp);
        cigar = BackTrack(dp, dp.m_max_i, dp.m_max_j, b.size());
        score = dp.m_max_score;
    }
    if(score < options.m_min_score)
        return SAlignmentResult();

    TRange qrange = cigar.QueryRange();
    TRange srange = cigar.SubjectRange();
    return MakeResult(cigar, a, b, score, options.m_score_normalize, qrange.first, srange.first, qrange.second+1, srange.second+1);
}

}; // namespace
