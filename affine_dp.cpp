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
#include <cstdlib>

#include "affine_dp.hpp"
#include "align_exception.hpp"

using namespace std;
namespace PairAlign {

void AffineFill(const string& a, const string& b, TScore gopen, TScore gapextend, const CScoringMatrix& delta, const SAffineEnds& ends, SAffineMatrix& dp) {
    int na = a.size();
    int nb = b.size();

    vector<TScore> s(nb+1);                      // best scores in current a-raw
    vector<TScore> sm(nb+1);                     // best scores in previous a-raw
    vector<TScore> gapb(nb+1, kBigNegative);     // best score with b-gap
    dp.m_mtrx.assign(size_t(na+1)*(nb+1), 0);
    dp.m_last_col.assign(na+1, 0);
    dp.m_max_score = 0;
    dp.m_max_i = 0;
    dp.m_max_j = 0;
    char* mtrx = dp.m_mtrx.data();

    bool free_row0 = ends.m_free_row0 || ends.m_local;
    bool free_col0 = ends.m_free_col0 || ends.m_local;

    sm[0] = 0;
    if(free_row0) {
        for(int j = 0; j <= nb; ++j) {
            sm[j] = 0;
            mtrx[j] = CCigar::Zero;
        }
    } else {                                     // ---------------
        for(int j = 1; j <= nb; ++j) {           // BBBBBBBBBBBBBBB
            sm[j] = gopen+gapextend*(j-1);
            mtrx[j] = CCigar::Agap;
        }
        if(nb > 0)
            mtrx[1] |= CCigar::Astart;
    }
    dp.m_last_col[0] = sm[nb];

    char* m = mtrx+nb;
    for(int i = 0; i < na; ++i) {
        if(free_col0) {
            s[0] = 0;
            *(++m) = CCigar::Zero;
        } else {                                            //AAAAAAAAAAAAAAA
            s[0] = gopen+gapextend*i;                       //---------------
            *(++m) = CCigar::Bstart|CCigar::Bgap;
        }

        TScore gapa = kBigNegative;
        char ai = a[i];
        for(int j = 0; j < nb; ) {
            *(++m) = 0;
            TScore ss = sm[j]+delta.Score(ai, b[j]);    // diagonal extension

            gapa += gapextend;                          // gapa extension
            if(s[j]+gopen >= gapa) {
                gapa = s[j]+gopen;                      // new gapa
                *m |= CCigar::Astart;
            }

            TScore& gapbj = gapb[++j];
            gapbj += gapextend;                         // gapb extension
            if(sm[j]+gopen >= gapbj) {
                gapbj = sm[j]+gopen;                    // new gapb
                *m |= CCigar::Bstart;
            }

            TScore h;
            if(gapa > gapbj) {
                if(ss >= gapa) {
                    h = ss;
                } else {
                    h = gapa;
                    *m |= CCigar::Agap;
                }
            } else {
                if(ss >= gapbj) {
                    h = ss;
                } else {
                    h = gapbj;
                    *m |= CCigar::Bgap;
                }
            }
            if(ends.m_local) {
                if(h <= 0) {
                    h = 0;
                    *m |= CCigar::Zero;
                } else if(h > dp.m_max_score) {
                    dp.m_max_score = h;
                    dp.m_max_i = i+1;
                    dp.m_max_j = j;
                }
            }
            s[j] = h;
        }
        swap(sm, s);
        dp.m_last_col[i+1] = sm[nb];
    }
    dp.m_last_row = sm;
}

CCigar BackTrack(const SAffineMatrix& dp, int i, int j, int nb) {
    int ia = i-1;
    int ib = j-1;
    const char* m = dp.m_mtrx.data()+size_t(i)*(nb+1)+j;
    CCigar track(ia, ib);
    while((ia >= 0 || ib >= 0) && !(*m&CCigar::Zero)) {
        if(*m&CCigar::Agap) {
            int len = 1;
            while(!(*m&CCigar::Astart)) {
                ++len;
                --m;
            }
            --m;
            ib -= len;
            track.PushFront(CCigar::SElement(len,'D'));
        } else if(*m&CCigar::Bgap) {
            int len = 1;
            while(!(*m&CCigar::Bstart)) {
                ++len;
                m -= nb+1;
            }
            m -= nb+1;
            ia -= len;
            track.PushFront(CCigar::SElement(len,'I'));
        } else {
            track.PushFront(CCigar::SElement(1,'M'));
            --ia;
            --ib;
            m -= nb+2;
        }
    }

    return track;
}

CCigar BandAlign(const string& a, const string& b, TScore gopen, TScore gapextend, const CScoringMatrix& delta, int band, TScore& score) {
    int na = a.size();
    int nb = b.size();
    int width = 2*band+1;    // cell (i,j) is stored at i*width+j-i+band

    vector<TScore> s(nb+1, kBigNegative);        // best scores in current a-raw
    vector<TScore> sm(nb+1, kBigNegative);       // best scores in previous a-raw
    vector<TScore> gapb(nb+1, kBigNegative);     // best score with b-gap
    vector<char> mtrx(size_t(na+1)*width, CCigar::Zero);

    sm[0] = 0;
    mtrx[band] = 0;
    for(int j = 1; j <= min(nb, band); ++j) {
        sm[j] = gopen+gapextend*(j-1);
        mtrx[j+band] = CCigar::Agap;
    }
    if(nb > 0 && band > 0)
        mtrx[1+band] |= CCigar::Astart;

    for(int i = 1; i <= na; ++i) {
        int jleft = max(0, i-band);
        int jright = min(nb, i+band);
        char* m = mtrx.data()+size_t(i)*width+jleft-i+band;
        if(jleft == 0) {
            s[0] = gopen+gapextend*(i-1);
            *m++ = CCigar::Bstart|CCigar::Bgap;
        }

        TScore gapa = kBigNegative;
        char ai = a[i-1];
        for(int j = max(jleft, 1); j <= jright; ++j, ++m) {
            *m = 0;
            TScore ss = sm[j-1]+delta.Score(ai, b[j-1]);
            TScore left = j > jleft ? s[j-1] : kBigNegative;  // left neighbour is outside of the band

            gapa += gapextend;
            if(left+gopen >= gapa) {
                gapa = left+gopen;
                *m |= CCigar::Astart;
            }

            TScore& gapbj = gapb[j];
            gapbj += gapextend;
            if(sm[j]+gopen >= gapbj) {
                gapbj = sm[j]+gopen;
                *m |= CCigar::Bstart;
            }

            if(gapa > gapbj) {
                if(ss >= gapa) {
                    s[j] = ss;
                } else {
                    s[j] = gapa;
                    *m |= CCigar::Agap;
                }
            } else {
                if(ss >= gapbj) {
                    s[j] = ss;
                } else {
                    s[j] = gapbj;
                    *m |= CCigar::Bgap;
                }
            }
        }
        swap(sm, s);
    }

    score = sm[nb];
    if(score <= kBigNegative/2)
        throw CAlignException(CAlignException::eBandConstraint, "Alignment could not reach end position - sequences may diverge beyond bandwidth ("+to_string(band)+"). Increase bandwidth or use standard alignment.");

    auto InBand = [band](int ia, int ib) { return ia >= -1 && ib >= -1 && abs(ib-ia) <= band; };
    auto Fail = [](int ia, int ib) {
        return CAlignException(CAlignException::eBandConstraint, "Traceback failed at position ("+to_string(ia+1)+","+to_string(ib+1)+"). This may indicate bandwidth is too small.");
    };

    int ia = na-1;
    int ib = nb-1;
    const char* m = mtrx.data()+size_t(na)*width+nb-na+band;
    CCigar track(ia, ib);
    while(ia >= 0 || ib >= 0) {
        if(*m&CCigar::Zero)
            throw Fail(ia, ib);
        if(*m&CCigar::Agap) {
            int len = 1;
            while(!(*m&CCigar::Astart)) {
                ++len;
                --m;
                if(!InBand(ia, ib-len+1))
                    throw Fail(ia, ib-len+1);
            }
            --m;
            ib -= len;
            track.PushFront(CCigar::SElement(len,'D'));
        } else if(*m&CCigar::Bgap) {
            int len = 1;
            while(!(*m&CCigar::Bstart)) {
                ++len;
                m -= width-1;
                if(!InBand(ia-len+1, ib))
                    throw Fail(ia-len+1, ib);
            }
            m -= width-1;
            ia -= len;
            track.PushFront(CCigar::SElement(len,'I'));
        } else {
            track.PushFront(CCigar::SElement(1,'M'));
            --ia;
            --ib;
            m -= width;
        }
        if(!InBand(ia, ib))
            throw Fail(ia, ib);
    }

    return track;
}

}; // namespace
