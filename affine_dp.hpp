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

#ifndef PAIRALIGN_AFFINE_DP__HPP
#define PAIRALIGN_AFFINE_DP__HPP

#include <string>
#include <vector>
#include <limits>

#include "scoring_matrix.hpp"
#include "cigar.hpp"

using namespace std;
namespace PairAlign {

const TScore kBigNegative = numeric_limits<int>::min()/2;

// Boundary conditions of the Gotoh recurrence
struct SAffineEnds {
    SAffineEnds(bool free_row0 = false, bool free_col0 = false, bool local = false) : m_free_row0(free_row0), m_free_col0(free_col0), m_local(local) {}
    bool m_free_row0;  // H(0,j) == 0 - subject prefix is not penalized
    bool m_free_col0;  // H(i,0) == 0 - query prefix is not penalized
    bool m_local;      // scores are floored at 0 and the maximum is tracked
};

struct SAffineMatrix {
    vector<char> m_mtrx;          // (na+1)*(nb+1) backtracking flags (see CCigar)
    vector<TScore> m_last_row;    // H(na,0..nb)
    vector<TScore> m_last_col;    // H(0..na,nb)
    TScore m_max_score;           // local only: first strict maximum in row-major order
    int m_max_i;
    int m_max_j;
};

//Gotoh fill for query a and subject b; gap of length l costs gopen+gapextend*(l-1)
void AffineFill(const string& a, const string& b, TScore gopen, TScore gapextend, const CScoringMatrix& delta, const SAffineEnds& ends, SAffineMatrix& dp);

//backtracking from DP cell (i,j) (1-based, i.e. last aligned characters are a[i-1] and b[j-1]) to a Zero flag or to the origin
CCigar BackTrack(const SAffineMatrix& dp, int i, int j, int nb);

//Gotoh restricted to |j-i| <= band; global ends; throws CAlignException(eBandConstraint)
CCigar BandAlign(const string& a, const string& b, TScore gopen, TScore gapextend, const CScoringMatrix& delta, int band, TScore& score);

}; // namespace

#endif  // PAIRALIGN_AFFINE_DP__HPP
