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

#ifndef PAIRALIGN_ALIGNMENT__HPP
#define PAIRALIGN_ALIGNMENT__HPP

#include <string>
#include <boost/variant.hpp>

#include "scoring_matrix.hpp"
#include "cigar.hpp"

using namespace std;
namespace PairAlign {

enum EGapModel {
    eAffine,                // exact three-state (Gotoh) recurrence
    eDirectionRemembered    // single matrix; a gap extends only if the neighbour was reached by the same gap
};

struct SAlignmentOptions {
    typedef boost::variant<string, CScoringMatrix> TMatrix;   // registry name or explicit matrix

    SAlignmentOptions() : m_matrix(string("BLOSUM62")), m_gap_open(-10), m_gap_extend(-1), m_case_normalize(true), m_score_normalize(false),
                          m_bandwidth(10), m_min_score(0), m_gap_model(eAffine) {}

    // resolves a matrix name through the registry
    const CScoringMatrix& Matrix() const;
    // throws CAlignException(eInvalidGapPenalty) if a penalty is positive
    void ValidateGaps() const;

    TMatrix m_matrix;
    TScore m_gap_open;       // first gap position
    TScore m_gap_extend;     // each additional gap position
    bool m_case_normalize;   // trim whitespace and upper-case the sequences
    bool m_score_normalize;  // divide score by alignment length
    int m_bandwidth;         // banded only
    TScore m_min_score;      // local only
    EGapModel m_gap_model;   // global and local only
};

struct SAlignmentResult {
    SAlignmentResult() : m_score(0), m_start_pos1(0), m_start_pos2(0), m_end_pos1(0), m_end_pos2(0), m_identity(0), m_identity_percent(0), m_alignment_length(0) {}

    string m_aligned_seq1;
    string m_aligned_seq2;
    TScore m_score;
    // half-open coordinates in the prepared sequences
    int m_start_pos1;
    int m_start_pos2;
    int m_end_pos1;
    int m_end_pos2;
    int m_identity;            // columns with identical non-gap characters
    double m_identity_percent;
    int m_alignment_length;
    CCigar m_cigar;            // transcript of m_aligned_seq1/m_aligned_seq2
};

// trims surrounding whitespace and upper-cases if case_normalize is set
string PrepareSequence(const string& seq, bool case_normalize);

// gapped strings and identity statistics of the transcript; positions are stored as given
SAlignmentResult MakeResult(const CCigar& cigar, const string& seq1, const string& seq2, TScore score, bool score_normalize,
                            int start1, int start2, int end1, int end2);

}; // namespace

#endif  // PAIRALIGN_ALIGNMENT__HPP
