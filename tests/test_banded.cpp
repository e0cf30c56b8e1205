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

#define BOOST_TEST_MODULE banded
#include <boost/test/unit_test.hpp>

#include "aligners.hpp"
#include "align_exception.hpp"

using namespace PairAlign;

namespace {
SAlignmentOptions DnaOptions(int bandwidth) {
    SAlignmentOptions options;
    options.m_matrix = string("DNA_SIMPLE");
    options.m_gap_open = -5;
    options.m_gap_extend = -2;
    options.m_bandwidth = bandwidth;
    return options;
}
}

BOOST_AUTO_TEST_CASE(single_mismatch) {
    SAlignmentResult r = CBandedAligner().Align("ACGTACGT", "ACGTTCGT", DnaOptions(2));
    BOOST_CHECK_EQUAL(r.m_score, 31);
    BOOST_CHECK_EQUAL(r.m_identity, 7);
    BOOST_CHECK_EQUAL(r.m_alignment_length, 8);
    BOOST_CHECK_EQUAL(r.m_aligned_seq1, "ACGTACGT");
    BOOST_CHECK_EQUAL(r.m_aligned_seq2, "ACGTTCGT");
    BOOST_CHECK_EQUAL(r.m_end_pos1, 8);
    BOOST_CHECK_EQUAL(r.m_end_pos2, 8);
}

BOOST_AUTO_TEST_CASE(length_difference_inside_band) {
    SAlignmentResult r = CBandedAligner().Align("ACGTACGTAA", "ACGTACGT", DnaOptions(2));
    BOOST_CHECK_EQUAL(r.m_score, 33);
    BOOST_CHECK_EQUAL(r.m_aligned_seq1, "ACGTACGTAA");
    BOOST_CHECK_EQUAL(r.m_aligned_seq2, "ACGTACGT--");
    BOOST_CHECK_EQUAL(r.m_cigar.CigarString(0, 10), "8M2I");

    SAlignmentResult global = CGlobalAligner().Align("ACGTACGTAA", "ACGTACGT", DnaOptions(2));
    BOOST_CHECK_EQUAL(r.m_score, global.m_score);
}

BOOST_AUTO_TEST_CASE(zero_bandwidth) {
    SAlignmentResult r = CBandedAligner().Align("ACGT", "AGGT", DnaOptions(0));
    BOOST_CHECK_EQUAL(r.m_score, 11);
    BOOST_CHECK_EQUAL(r.m_identity, 3);
    BOOST_CHECK_EQUAL(r.m_aligned_seq1, "ACGT");
    BOOST_CHECK_EQUAL(r.m_aligned_seq2, "AGGT");
}

BOOST_AUTO_TEST_CASE(wide_band_matches_global) {
    const char* pairs[][2] = {{"GATTACA", "GCATGCT"}, {"AAACCCGGGTTT", "ACGTACGT"}, {"TGTTACGG", "GGTTGACTA"}};
    for(auto& p : pairs) {
        SAlignmentResult banded = CBandedAligner().Align(p[0], p[1], DnaOptions(20));
        SAlignmentResult global = CGlobalAligner().Align(p[0], p[1], DnaOptions(20));
        BOOST_CHECK_EQUAL(banded.m_score, global.m_score);
    }
}

BOOST_AUTO_TEST_CASE(narrow_band_never_beats_global) {
    SAlignmentResult banded = CBandedAligner().Align("AAAAGGGGCCCC", "GGGGCCCCAAAA", DnaOptions(1));
    SAlignmentResult global = CGlobalAligner().Align("AAAAGGGGCCCC", "GGGGCCCCAAAA", DnaOptions(1));
    BOOST_CHECK_LE(banded.m_score, global.m_score);
}

BOOST_AUTO_TEST_CASE(negative_bandwidth) {
    try {
        CBandedAligner().Align("ACGT", "ACGT", DnaOptions(-1));
        BOOST_FAIL("exception expected");
    } catch(CAlignException& e) {
        BOOST_CHECK_EQUAL(e.GetErrCode(), CAlignException::eBandConstraint);
        BOOST_CHECK_EQUAL(string(e.what()), "bandwidth must be non-negative");
    }
}

BOOST_AUTO_TEST_CASE(length_difference_outside_band) {
    try {
        CBandedAligner().Align("ACGTACGTAA", "ACGT", DnaOptions(2));
        BOOST_FAIL("exception expected");
    } catch(CAlignException& e) {
        BOOST_CHECK_EQUAL(e.GetErrCode(), CAlignException::eBandConstraint);
        BOOST_CHECK_EQUAL(string(e.what()), "Sequence length difference (6) exceeds bandwidth (2). Increase bandwidth or use standard alignment.");
    }
}

BOOST_AUTO_TEST_CASE(empty_sequence) {
    BOOST_CHECK_THROW(CBandedAligner().Align("", "ACGT", DnaOptions(2)), CAlignException);
}
