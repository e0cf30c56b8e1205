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

#define BOOST_TEST_MODULE properties
#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <cstdlib>
#include <cstring>

#include "aligners.hpp"

using namespace PairAlign;

namespace {
const char* kPairs[][2] = {
    {"ACGTA", "ACGT"},
    {"TGTTACGG", "GGTTGACTA"},
    {"GATTACAGATTACA", "TACAGGG"},
    {"AAAAAAAA", "AAAATTTTAAAA"},
    {"CCCC", "G"},
    {"ACGTTGCAAGTC", "ACGTAGCAGTCA"}
};

SAlignmentOptions DnaOptions(TScore gap_open, TScore gap_extend) {
    SAlignmentOptions options;
    options.m_matrix = string("DNA_SIMPLE");
    options.m_gap_open = gap_open;
    options.m_gap_extend = gap_extend;
    options.m_bandwidth = 20;
    return options;
}

string Degap(string s) {
    s.erase(remove(s.begin(), s.end(), '-'), s.end());
    return s;
}

int CountIdentity(const string& s1, const string& s2) {
    int identity = 0;
    for(size_t p = 0; p < s1.size(); ++p) {
        if(s1[p] != '-' && s1[p] == s2[p])
            ++identity;
    }
    return identity;
}

void CheckConsistency(const SAlignmentResult& r, const string& seq1, const string& seq2) {
    BOOST_CHECK_EQUAL(r.m_aligned_seq1.size(), r.m_aligned_seq2.size());
    BOOST_CHECK_EQUAL(r.m_alignment_length, (int)r.m_aligned_seq1.size());
    BOOST_CHECK_EQUAL(Degap(r.m_aligned_seq1), seq1);
    BOOST_CHECK_EQUAL(Degap(r.m_aligned_seq2), seq2);
    for(size_t p = 0; p < r.m_aligned_seq1.size(); ++p)
        BOOST_CHECK(r.m_aligned_seq1[p] != '-' || r.m_aligned_seq2[p] != '-');
    BOOST_CHECK_EQUAL(r.m_identity, CountIdentity(r.m_aligned_seq1, r.m_aligned_seq2));
    BOOST_CHECK_LE(r.m_identity, r.m_alignment_length);
    if(r.m_alignment_length > 0)
        BOOST_CHECK_CLOSE(r.m_identity_percent, 100.*r.m_identity/r.m_alignment_length, 1e-9);

    TCharAlign align = r.m_cigar.ToAlign(seq1.c_str(), seq2.c_str());
    BOOST_CHECK_EQUAL(align.first, r.m_aligned_seq1);
    BOOST_CHECK_EQUAL(align.second, r.m_aligned_seq2);
}
}

BOOST_AUTO_TEST_CASE(full_length_variants_reproduce_input) {
    SAlignmentOptions options = DnaOptions(-5, -2);
    for(auto& p : kPairs) {
        for(const char* name : {"global", "semiglobal", "overlap", "hirschberg"}) {
            BOOST_TEST_CONTEXT(name << " " << p[0] << " " << p[1]) {
                SAlignmentResult r = CreateAligner(name)->Align(p[0], p[1], options);
                CheckConsistency(r, p[0], p[1]);
            }
        }
        string s1 = p[0];
        string s2 = p[1];
        if(abs(int(s1.size())-int(s2.size())) <= options.m_bandwidth) {
            SAlignmentResult r = CBandedAligner().Align(p[0], p[1], options);
            CheckConsistency(r, p[0], p[1]);
        }
    }
}

BOOST_AUTO_TEST_CASE(local_reproduces_substrings) {
    SAlignmentOptions options = DnaOptions(-5, -2);
    for(auto& p : kPairs) {
        string s1 = p[0];
        string s2 = p[1];
        SAlignmentResult r = CLocalAligner().Align(s1, s2, options);
        BOOST_CHECK_GE(r.m_score, 0);
        BOOST_CHECK_EQUAL(Degap(r.m_aligned_seq1), s1.substr(r.m_start_pos1, r.m_end_pos1-r.m_start_pos1));
        BOOST_CHECK_EQUAL(Degap(r.m_aligned_seq2), s2.substr(r.m_start_pos2, r.m_end_pos2-r.m_start_pos2));
        BOOST_CHECK_EQUAL(r.m_identity, CountIdentity(r.m_aligned_seq1, r.m_aligned_seq2));
    }
}

BOOST_AUTO_TEST_CASE(score_matches_transcript) {
    const CScoringMatrix& delta = GetMatrix("DNA_SIMPLE");
    for(auto& p : kPairs) {
        string s1 = p[0];
        string s2 = p[1];
        SAlignmentResult global = CGlobalAligner().Align(s1, s2, DnaOptions(-5, -2));
        BOOST_CHECK_EQUAL(global.m_score, global.m_cigar.Score(s1.c_str(), s2.c_str(), -5, -2, delta));

        SAlignmentResult local = CLocalAligner().Align(s1, s2, DnaOptions(-5, -2));
        BOOST_CHECK_EQUAL(local.m_score, local.m_cigar.Score(s1.c_str(), s2.c_str(), -5, -2, delta));
    }
}

BOOST_AUTO_TEST_CASE(variant_score_ordering) {
    SAlignmentOptions options = DnaOptions(-5, -2);
    for(auto& p : kPairs) {
        TScore global = CGlobalAligner().Align(p[0], p[1], options).m_score;
        TScore semi = CSemiGlobalAligner().Align(p[0], p[1], options).m_score;
        TScore overlap = COverlapAligner().Align(p[0], p[1], options).m_score;
        TScore local = CLocalAligner().Align(p[0], p[1], options).m_score;
        BOOST_CHECK_LE(global, overlap);
        BOOST_CHECK_LE(overlap, semi);
        BOOST_CHECK_LE(semi, local);
    }
}

BOOST_AUTO_TEST_CASE(global_score_is_symmetric) {
    for(auto& p : kPairs) {
        SAlignmentResult forward = CGlobalAligner().Align(p[0], p[1], DnaOptions(-5, -2));
        SAlignmentResult backward = CGlobalAligner().Align(p[1], p[0], DnaOptions(-5, -2));
        BOOST_CHECK_EQUAL(forward.m_score, backward.m_score);
    }
    SAlignmentResult forward = CGlobalAligner().Align("HEAGAWGHEE", "PAWHEAE");
    SAlignmentResult backward = CGlobalAligner().Align("PAWHEAE", "HEAGAWGHEE");
    BOOST_CHECK_EQUAL(forward.m_score, backward.m_score);
}

BOOST_AUTO_TEST_CASE(self_alignment) {
    const CScoringMatrix& blosum = GetMatrix("BLOSUM62");
    string seq = "MKTAYIAKQRQISFVKSHFSRQ";
    TScore expected = 0;
    for(char c : seq)
        expected += blosum.Score(c, c);
    for(const string& name : AlignerNames()) {
        SAlignmentResult r = CreateAligner(name)->Align(seq, seq);
        BOOST_CHECK_EQUAL(r.m_score, expected);
        BOOST_CHECK_EQUAL(r.m_identity, (int)seq.size());
        BOOST_CHECK_CLOSE(r.m_identity_percent, 100., 1e-9);
    }
}

BOOST_AUTO_TEST_CASE(hirschberg_equals_linear_gap_global) {
    for(auto& p : kPairs) {
        SAlignmentResult global = CGlobalAligner().Align(p[0], p[1], DnaOptions(-3, -3));
        SAlignmentResult hirschberg = CSpaceEfficientAligner().Align(p[0], p[1], DnaOptions(-3, -3));
        BOOST_CHECK_EQUAL(global.m_score, hirschberg.m_score);
    }
}

BOOST_AUTO_TEST_CASE(legacy_model_never_beats_affine) {
    SAlignmentOptions affine = DnaOptions(-5, -2);
    SAlignmentOptions legacy = affine;
    legacy.m_gap_model = eDirectionRemembered;
    for(auto& p : kPairs) {
        BOOST_CHECK_LE(CGlobalAligner().Align(p[0], p[1], legacy).m_score, CGlobalAligner().Align(p[0], p[1], affine).m_score);
        BOOST_CHECK_LE(CLocalAligner().Align(p[0], p[1], legacy).m_score, CLocalAligner().Align(p[0], p[1], affine).m_score);
    }
}

BOOST_AUTO_TEST_CASE(normalized_score) {
    SAlignmentOptions raw = DnaOptions(-5, -2);
    SAlignmentOptions normalized = raw;
    normalized.m_score_normalize = true;
    for(const string& name : AlignerNames()) {
        for(auto& p : kPairs) {
            if(name == "banded" && abs(int(strlen(p[0]))-int(strlen(p[1]))) > raw.m_bandwidth)
                continue;
            SAlignmentResult r = CreateAligner(name)->Align(p[0], p[1], raw);
            SAlignmentResult n = CreateAligner(name)->Align(p[0], p[1], normalized);
            if(r.m_alignment_length > 0)
                BOOST_CHECK_CLOSE(n.m_score, r.m_score/r.m_alignment_length, 1e-9);
            else
                BOOST_CHECK_EQUAL(n.m_score, 0);
        }
    }
}
