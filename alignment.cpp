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

#include <boost/algorithm/string.hpp>

#include "alignment.hpp"
#include "align_exception.hpp"

using namespace std;
namespace PairAlign {

namespace {
struct SMatrixVisitor : public boost::static_visitor<const CScoringMatrix&> {
    const CScoringMatrix& operator()(const string& name) const { return GetMatrix(name); }
    const CScoringMatrix& operator()(const CScoringMatrix& matrix) const { return matrix; }
};
} // namespace

const CScoringMatrix& SAlignmentOptions::Matrix() const {
    return boost::apply_visitor(SMatrixVisitor(), m_matrix);
}

void SAlignmentOptions::ValidateGaps() const {
    if(m_gap_open > 0)
        throw CAlignException(CAlignException::eInvalidGapPenalty, "gap_open must be <= 0, got "+to_string(m_gap_open));
    if(m_gap_extend > 0)
        throw CAlignException(CAlignException::eInvalidGapPenalty, "gap_extend must be <= 0, got "+to_string(m_gap_extend));
}

string PrepareSequence(const string& seq, bool case_normalize) {
    if(!case_normalize)
        return seq;
    return boost::algorithm::to_upper_copy(boost::algorithm::trim_copy(seq));
}

SAlignmentResult MakeResult(const CCigar& cigar, const string& seq1, const string& seq2, TScore score, bool score_normalize,
                            int start1, int start2, int end1, int end2) {
    SAlignmentResult result;
    TCharAlign align = cigar.ToAlign(seq1.c_str(), seq2.c_str());
    result.m_aligned_seq1 = align.first;
    result.m_aligned_seq2 = align.second;
    result.m_alignment_length = align.first.size();
    result.m_identity = cigar.Matches(seq1.c_str(), seq2.c_str());
    if(result.m_alignment_length > 0)
        result.m_identity_percent = 100.*result.m_identity/result.m_alignment_length;
    if(score_normalize)
        result.m_score = result.m_alignment_length > 0 ? score/result.m_alignment_length : 0;
    else
        result.m_score = score;
    result.m_start_pos1 = start1;
    result.m_start_pos2 = start2;
    result.m_end_pos1 = end1;
    result.m_end_pos2 = end2;
    result.m_cigar = cigar;

    return result;
}

}; // namespace
