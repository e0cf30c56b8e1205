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

#include <vector>

#include "legacy_dp.hpp"

using namespace std;
namespace PairAlign {

namespace {

enum EDirection { eNone = 0, eDiagonal, eUp, eLeft };

class CLegacyMatrix {
public:
    CLegacyMatrix(int na, int nb) : m_nb(nb), m_score(size_t(na+1)*(nb+1), 0), m_dir(size_t(na+1)*(nb+1), eNone) {}
    TScore& Score(int i, int j) { return m_score[size_t(i)*(m_nb+1)+j]; }
    char& Dir(int i, int j) { return m_dir[size_t(i)*(m_nb+1)+j]; }

    CCigar BackTrack(int i, int j, bool local) {
        CCigar track(i-1, j-1);
        while(local ? (i > 0 && j > 0 && Score(i, j) > 0) : (i > 0 || j > 0)) {
            char d = Dir(i, j);
            if(d == eDiagonal) {
                track.PushFront(CCigar::SElement(1,'M'));
                --i;
                --j;
            } else if(d == eUp) {
                track.PushFront(CCigar::SElement(1,'I'));
                --i;
            } else if(d == eLeft) {
                track.PushFront(CCigar::SElement(1,'D'));
                --j;
            } else {
                break;
            }
        }
        return track;
    }

private:
    int m_nb;
    vector<TScore> m_score;
    vector<char> m_dir;
};

} // namespace

SLegacyAlign LegacyGlbAlign(const string& a, const string& b, TScore gopen, TScore gapextend, const CScoringMatrix& delta) {
    int na = a.size();
    int nb = b.size();
    CLegacyMatrix mtrx(na, nb);

    for(int i = 1; i <= na; ++i) {
        mtrx.Score(i, 0) = gopen+gapextend*(i-1);
        mtrx.Dir(i, 0) = eUp;
    }
    for(int j = 1; j <= nb; ++j) {
        mtrx.Score(0, j) = gopen+gapextend*(j-1);
        mtrx.Dir(0, j) = eLeft;
    }

    for(int i = 1; i <= na; ++i) {
        for(int j = 1; j <= nb; ++j) {
            TScore diagonal = mtrx.Score(i-1, j-1)+delta.Score(a[i-1], b[j-1]);
            TScore up = mtrx.Score(i-1, j)+(mtrx.Dir(i-1, j) == eUp ? gapextend : gopen);
            TScore left = mtrx.Score(i, j-1)+(mtrx.Dir(i, j-1) == eLeft ? gapextend : gopen);
            if(diagonal >= up && diagonal >= left) {
                mtrx.Score(i, j) = diagonal;
                mtrx.Dir(i, j) = eDiagonal;
            } else if(up >= left) {
                mtrx.Score(i, j) = up;
                mtrx.Dir(i, j) = eUp;
            } else {
                mtrx.Score(i, j) = left;
                mtrx.Dir(i, j) = eLeft;
            }
        }
    }

    SLegacyAlign result;
    result.m_cigar = mtrx.BackTrack(na, nb, false);
    result.m_score = mtrx.Score(na, nb);
    return result;
}

SLegacyAlign LegacyLclAlign(const string& a, const string& b, TScore gopen, TScore gapextend, const CScoringMatrix& delta) {
    int na = a.size();
    int nb = b.size();
    CLegacyMatrix mtrx(na, nb);

    TScore max_score = 0;
    int max_i = 0;
    int max_j = 0;
    for(int i = 1; i <= na; ++i) {
        for(int j = 1; j <= nb; ++j) {
            TScore diagonal = mtrx.Score(i-1, j-1)+delta.Score(a[i-1], b[j-1]);
            TScore up = mtrx.Score(i-1, j)+(mtrx.Dir(i-1, j) == eUp ? gapextend : gopen);
            TScore left = mtrx.Score(i, j-1)+(mtrx.Dir(i, j-1) == eLeft ? gapextend : gopen);

            TScore best = 0;
            char dir = eNone;
            if(diagonal > best) {
                best = diagonal;
                dir = eDiagonal;
            }
            if(up > best) {
                best = up;
                dir = eUp;
            }
            if(left > best) {
                best = left;
                dir = eLeft;
            }
            mtrx.Score(i, j) = best;
            mtrx.Dir(i, j) = dir;

            if(best > max_score) {
                max_score = best;
                max_i = i;
                max_j = j;
            }
        }
    }

    SLegacyAlign result;
    result.m_cigar = mtrx.BackTrack(max_i, max_j, true);
    result.m_score = max_score;
    return result;
}

}; // namespace
