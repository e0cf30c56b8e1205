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

#ifndef PAIRALIGN_CIGAR__HPP
#define PAIRALIGN_CIGAR__HPP

#include <utility>
#include <string>
#include <list>
#include <ostream>

#include "scoring_matrix.hpp"

using namespace std;
namespace PairAlign {

typedef pair<string,string> TCharAlign;
typedef pair<int,int> TRange;

// Edit transcript of an alignment of query (seq1) to subject (seq2).
// 'M' - aligned pair, 'I' - query character against a gap, 'D' - gap against subject character.
// Ranges are inclusive; an empty cigar built for position p has from == p+1, to == p.
class CCigar {
public:
    // backtracking flags stored in DP trace matrices
    enum {
        Agap = 1,     // best score ends with a gap in query (horizontal move)
        Bgap = 2,     // best score ends with a gap in subject (vertical move)
        Astart = 4,   // horizontal gap was opened in this cell
        Bstart = 8,   // vertical gap was opened in this cell
        Zero = 16     // stop backtracking
    };

    CCigar(int qto = -1, int sto = -1) : m_qfrom(qto+1), m_qto(qto), m_sfrom(sto+1), m_sto(sto) {}
    struct SElement {
        SElement(int l, char t) : m_len(l), m_type(t) {}
        int m_len;
        char m_type;  // 'M' 'D' 'I'
    };
    void PushFront(const SElement& el);
    void PushBack(const SElement& el);
    bool Empty() const { return m_elements.empty(); }

    string CigarString(int qstart, int qlen) const; // qstart, qlen identify notaligned 5'/3' parts
    string DetailedCigarString(int qstart, int qlen, const char* query, const char* subject) const;
    string BtopString(const char* query, const char* subject) const;
    TRange QueryRange() const { return TRange(m_qfrom, m_qto); }
    TRange SubjectRange() const { return TRange(m_sfrom, m_sto); }
    TCharAlign ToAlign(const char* query, const char* subject) const;
    int Matches(const char* query, const char* subject) const;
    // a gap of length l costs gopen+gapextend*(l-1)
    TScore Score(const char* query, const char* subject, TScore gopen, TScore gapextend, const CScoringMatrix& delta) const;
    void PrintAlign(const char* query, const char* subject, const CScoringMatrix& delta, ostream& os) const;

private:
    list<SElement> m_elements;
    int m_qfrom, m_qto, m_sfrom, m_sto;
};

}; // namespace

#endif  // PAIRALIGN_CIGAR__HPP
