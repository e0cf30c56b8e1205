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

using namespace std;
namespace PairAlign {

SAlignmentResult CSemiGlobalAligner::DoAlign(const string& seq1, const string& seq2, const SAlignmentOptions& options) const {
    string a;
    string b;
    PrepareAndValidate(seq1, seq2, options, a, b);
    const CScoringMatrix& delta = options.Matrix();
    int na = a.size();
    int nb = b.size();

    SAffineMatrix dp;
    AffineFill(a, b, options.m_gap_open, options.m_gap_extend, delta, SAffineEnds(true, true, false), dp);

    // best cell on the last row, then on the last column
    TScore score = kBigNegative;
    int maxi = na;
    int maxj = nb;
    for(int j = 0; j <= nb; ++j) {
        if(dp.m_last_row[j] > score) {
            score = dp.m_last_row[j];
            maxj = j;
        }
    }
    for(int i = 0; i <= na; ++i) {
        if(dp.m_last_col[i] > score) {
            score = dp.m_last_col[i];
            maxi = i;
            maxj = nb;
        }
    }

    CCigar cigar = BackTrack(dp, maxi, maxj, nb);

    // free end gaps: leading subject then query prefix, trailing query then subject suffix
    // the leading gaps reach the origin so both start positions are 0
    cigar.PushFront(CCigar::SElement(cigar.QueryRange().first, 'I'));
    cigar.PushFront(CCigar::SElement(cigar.SubjectRange().first, 'D'));
    cigar.PushBack(CCigar::SElement(na-maxi, 'I'));
    cigar.PushBack(CCigar::SElement(nb-maxj, 'D'));

    return MakeResult(cigar, a, b, score, options.m_score_normalize, 0, 0, maxi, maxj);
}

SAlignmentResult COverlapAligner::DoAlign(const string& seq1, const string& seq2, const SAlignmentOptions& options) const {
    string a;
    string b;
    PrepareAndValidate(seq1, seq2, options, a, b);
    const CScoringMatrix& delta = options.Matrix();
    int na = a.size();
    int nb = b.size();

    SAffineMatrix dp;
    AffineFill(a, b, options.m_gap_open, options.m_gap_extend, delta, SAffineEnds(true, false, false), dp);

    TScore score = kBigNegative;
    int maxi = na;
    for(int i = 0; i <= na; ++i) {
        if(dp.m_last_col[i] > score) {
            score = dp.m_last_col[i];
            maxi = i;
        }
    }

    // query prefix is penalized so the traceback always ends on the first row
    CCigar cigar = BackTrack(dp, maxi, nb, nb);
    int start2 = cigar.SubjectRange().first;
    cigar.PushFront(CCigar::SElement(start2, 'D'));
    cigar.PushBack(CCigar::SElement(na-maxi, 'I'));

    return MakeResult(cigar, a, b, score, options.m_score_normalize, 0, start2, maxi, nb);
}

}; // namespace
