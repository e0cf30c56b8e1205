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

#include <algorithm>
#include <stack>

#include "aligners.hpp"

using namespace std;
namespace PairAlign {

vector<TScore> CSpaceEfficientAligner::LastRowScores(const string& a, const string& b, TScore gap, const CScoringMatrix& delta) {
    int na = a.size();
    int nb = b.size();
    vector<TScore> prev(nb+1);
    vector<TScore> curr(nb+1);
    for(int j = 0; j <= nb; ++j)
        prev[j] = j*gap;

    for(int i = 0; i < na; ++i) {
        curr[0] = (i+1)*gap;
        for(int j = 1; j <= nb; ++j)
            curr[j] = max(prev[j-1]+delta.Score(a[i], b[j-1]), max(prev[j]+gap, curr[j-1]+gap));
        swap(prev, curr);
    }

    return prev;
}

namespace {
struct SSubproblem {
    int m_afrom;
    int m_alen;
    int m_bfrom;
    int m_blen;
};
} // namespace

SAlignmentResult CSpaceEfficientAligner::DoAlign(const string& seq1, const string& seq2, const SAlignmentOptions& options) const {
    string a;
    string b;
    PrepareAndValidate(seq1, seq2, options, a, b);
    const CScoringMatrix& delta = options.Matrix();
    TScore gap = options.m_gap_open;
    int na = a.size();
    int nb = b.size();

    // subproblems are solved left to right; right half is pushed first
    CCigar cigar;
    stack<SSubproblem> work;
    work.push(SSubproblem{0, na, 0, nb});
    while(!work.empty()) {
        SSubproblem sub = work.top();
        work.pop();

        if(sub.m_alen == 0) {
            cigar.PushBack(CCigar::SElement(sub.m_blen, 'D'));
        } else if(sub.m_blen == 0) {
            cigar.PushBack(CCigar::SElement(sub.m_alen, 'I'));
        } else if(sub.m_alen == 1) {
            char c = a[sub.m_afrom];
            int n = sub.m_blen;
            int best_offset = 0;
            TScore best_score = 0;
            for(int offset = 0; offset <= n; ++offset) {
                TScore score;
                if(offset < n)
                    score = offset*gap+delta.Score(c, b[sub.m_bfrom+offset])+(n-offset-1)*gap;
                else
                    score = (n+1)*gap;     // c is not paired
                if(offset == 0 || score > best_score) {
                    best_score = score;
                    best_offset = offset;
                }
            }
            if(best_offset == n) {
                cigar.PushBack(CCigar::SElement(n, 'D'));
                cigar.PushBack(CCigar::SElement(1, 'I'));
            } else {
                cigar.PushBack(CCigar::SElement(best_offset, 'D'));
                cigar.PushBack(CCigar::SElement(1, 'M'));
                cigar.PushBack(CCigar::SElement(n-best_offset-1, 'D'));
            }
        } else {
            int mid = sub.m_alen/2;
            string aleft = a.substr(sub.m_afrom, mid);
            string aright = a.substr(sub.m_afrom+mid, sub.m_alen-mid);
            string bsub = b.substr(sub.m_bfrom, sub.m_blen);
            vector<TScore> left = LastRowScores(aleft, bsub, gap, delta);
            reverse(aright.begin(), aright.end());
            reverse(bsub.begin(), bsub.end());
            vector<TScore> right = LastRowScores(aright, bsub, gap, delta);

            int n = sub.m_blen;
            int split = 0;
            TScore best_score = left[0]+right[n];
            for(int j = 1; j <= n; ++j) {
                TScore score = left[j]+right[n-j];
                if(score > best_score) {
                    best_score = score;
                    split = j;
                }
            }
            work.push(SSubproblem{sub.m_afrom+mid, sub.m_alen-mid, sub.m_bfrom+split, n-split});
            work.push(SSubproblem{sub.m_afrom, mid, sub.m_bfrom, split});
        }
    }

    TScore score = cigar.Score(a.c_str(), b.c_str(), gap, gap, delta);
    return MakeResult(cigar, a, b, score, options.m_score_normalize, 0, 0, na, nb);
}

}; // namespace
