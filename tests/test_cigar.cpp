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

#define BOOST_TEST_MODULE cigar
#include <sstream>
#include <boost/test/unit_test.hpp>

#include "cigar.hpp"

using namespace PairAlign;

namespace {
// GTT-AC/GTTGAC inside TGTTACGG/GGTTGACTA
CCigar LocalExample() {
    CCigar cigar(0, 0);
    cigar.PushBack(CCigar::SElement(3, 'M'));
    cigar.PushBack(CCigar::SElement(1, 'D'));
    cigar.PushBack(CCigar::SElement(2, 'M'));
    return cigar;
}
const char* kQuery = "TGTTACGG";
const char* kSubject = "GGTTGACTA";
}

BOOST_AUTO_TEST_CASE(ranges_follow_pushes) {
    CCigar cigar = LocalExample();
    BOOST_CHECK_EQUAL(cigar.QueryRange().first, 1);
    BOOST_CHECK_EQUAL(cigar.QueryRange().second, 5);
    BOOST_CHECK_EQUAL(cigar.SubjectRange().first, 1);
    BOOST_CHECK_EQUAL(cigar.SubjectRange().second, 6);

    CCigar empty(4, 2);
    BOOST_CHECK(empty.Empty());
    BOOST_CHECK_EQUAL(empty.QueryRange().first, 5);
    BOOST_CHECK_EQUAL(empty.QueryRange().second, 4);
}

BOOST_AUTO_TEST_CASE(equal_neighbours_are_merged) {
    CCigar cigar(3, 3);
    cigar.PushFront(CCigar::SElement(2, 'M'));
    cigar.PushFront(CCigar::SElement(1, 'M'));
    cigar.PushFront(CCigar::SElement(1, 'I'));
    cigar.PushFront(CCigar::SElement(0, 'D'));
    BOOST_CHECK_EQUAL(cigar.CigarString(0, 4), "1I3M");
    BOOST_CHECK_EQUAL(cigar.QueryRange().first, 0);
    BOOST_CHECK_EQUAL(cigar.SubjectRange().first, 1);

    CCigar head;
    head.PushBack(CCigar::SElement(1, 'D'));
    head.PushBack(CCigar::SElement(1, 'M'));
    head.PushBack(CCigar::SElement(2, 'M'));
    head.PushBack(CCigar::SElement(0, 'I'));
    BOOST_CHECK_EQUAL(head.CigarString(0, 3), "1D3M");
}

BOOST_AUTO_TEST_CASE(strings) {
    CCigar cigar = LocalExample();
    BOOST_CHECK_EQUAL(cigar.CigarString(0, 8), "1S3M1D2M2S");
    BOOST_CHECK_EQUAL(cigar.DetailedCigarString(0, 8, kQuery, kSubject), "1S3=1D2=2S");
    BOOST_CHECK_EQUAL(cigar.BtopString(kQuery, kSubject), "3-G2");

    TCharAlign align = cigar.ToAlign(kQuery, kSubject);
    BOOST_CHECK_EQUAL(align.first, "GTT-AC");
    BOOST_CHECK_EQUAL(align.second, "GTTGAC");
}

BOOST_AUTO_TEST_CASE(statistics) {
    CCigar cigar = LocalExample();
    BOOST_CHECK_EQUAL(cigar.Matches(kQuery, kSubject), 5);

    CScoringMatrix delta(5, -4);
    BOOST_CHECK_EQUAL(cigar.Score(kQuery, kSubject, -3, -1, delta), 22);

    // ACGTA/ACGT-
    CCigar global;
    global.PushBack(CCigar::SElement(4, 'M'));
    global.PushBack(CCigar::SElement(1, 'I'));
    BOOST_CHECK_EQUAL(global.Score("ACGTA", "ACGT", -5, -2, delta), 15);
    BOOST_CHECK_EQUAL(global.BtopString("ACGTA", "ACGT"), "4A-");
}

BOOST_AUTO_TEST_CASE(mismatches_in_detailed_strings) {
    CCigar cigar;
    cigar.PushBack(CCigar::SElement(4, 'M'));
    BOOST_CHECK_EQUAL(cigar.DetailedCigarString(0, 4, "ACGT", "AGGT"), "1=1X2=");
    BOOST_CHECK_EQUAL(cigar.BtopString("ACGT", "AGGT"), "1CG2");
    BOOST_CHECK_EQUAL(cigar.Score("ACGT", "AGGT", -5, -2, CScoringMatrix(5, -4)), 11);
}

BOOST_AUTO_TEST_CASE(print_align) {
    CCigar cigar;
    cigar.PushBack(CCigar::SElement(2, 'M'));
    cigar.PushBack(CCigar::SElement(1, 'D'));
    cigar.PushBack(CCigar::SElement(1, 'M'));
    CScoringMatrix::TTable table;
    table['A']['A'] = 1;
    table['C']['C'] = 1;
    table['C']['G'] = 2;
    table['T']['T'] = 1;
    CScoringMatrix delta(table);

    ostringstream os;
    cigar.PrintAlign("ACT", "AGTT", delta, os);
    BOOST_CHECK_EQUAL(os.str(), "AC-T\n|+ |\nAGTT\n");
}
