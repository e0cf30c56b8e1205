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


#include "cigar.hpp"

using namespace std;
namespace PairAlign {

void CCigar::PushFront(const SElement& el) {
    if(el.m_len <= 0)
        return;
    if(el.m_type == 'M') {
        m_qfrom -= el.m_len;
        m_sfrom -= el.m_len;
    } else if(el.m_type == 'D')
        m_sfrom -= el.m_len;
    else
        m_qfrom -= el.m_len;
            
    if(m_elements.empty() || m_elements.front().m_type != el.m_type)
        m_elements.push_front(el);
    else
        m_elements.front().m_len += el.m_len;
}

void CCigar::PushBack(const SElement& el) {
    if(el.m_len <= 0)
        return;
    if(el.m_type == 'M') {
        m_qto += el.m_len;
        m_sto += el.m_len;
    } else if(el.m_type == 'D')
        m_sto += el.m_len;
    else
        m_qto += el.m_len;
            
    if(m_elements.empty() || m_elements.back().m_type != el.m_type)
        m_elements.push_back(el);
    else
        m_elements.back().m_len += el.m_len;
}

string CCigar::CigarString(int qstart, int qlen) const {
    string cigar;
    for(auto& element : m_elements)
        cigar += to_string(element.m_len)+element.m_type;

    int missingstart = qstart+m_qfrom;
    if(missingstart > 0)
        cigar = to_string(missingstart)+"S"+cigar;
    int missingend = qlen-1-m_qto-qstart;
    if(missingend > 0)
        cigar += to_string(missingend)+"S";

    return cigar;
}

string CCigar::DetailedCigarString(int qstart, int qlen, const char* query, const char* subject) const {
    string cigar;
    query += m_qfrom;
    subject += m_sfrom;
    for(auto& element : m_elements) {
        if(element.m_type == 'M') {
            bool is_match = *query == *subject;
            int len = 0;
            for(int l = 0; l < element.m_len; ++l) {
                if((*query == *subject) == is_match) {
                    ++len;
                } else {
                    cigar += to_string(len)+ (is_match ? "=" : "X"); 
                    is_match = !is_match;
                    len = 1;
                }
                ++query;
                ++subject;
            }
            cigar += to_string(len)+ (is_match ? "=" : "X"); 
        } else if(element.m_type == 'D') {
            cigar += to_string(element.m_len)+element.m_type;
            subject += element.m_len;
        } else {
            cigar += to_string(element.m_len)+element.m_type;
            query += element.m_len;
        }
    }

    int missingstart = qstart+m_qfrom;
    if(missingstart > 0)
        cigar = to_string(missingstart)+"S"+cigar;
    int missingend = qlen-1-m_qto-qstart;
    if(missingend > 0)
        cigar += to_string(missingend)+"S";
    
    return cigar;
}

string CCigar::BtopString(const char* query, const char* subject) const {
    string btop;
    query += m_qfrom;
    subject += m_sfrom;
    int match_len = 0;
    for(auto& element : m_elements) {
        if(element.m_type == 'M') {
            for(int l = 0; l < element.m_len; ++l) {
                if(*query == *subject) {
                    ++match_len;
                } else {
                    if(match_len > 0) {
                        btop  += to_string(match_len);
                        match_len = 0;
                    }
                    btop += *query;
                    btop += *subject;
                }
                ++query;
                ++subject;
            }
        } else {
            if(match_len > 0) {
                btop  += to_string(match_len);
                match_len = 0;
            }
            if(element.m_type == 'D') {
                for(int l = 0; l < element.m_len; ++l) {
                    btop += '-';
                    btop += *subject++;
                }
            } else {
                for(int l = 0; l < element.m_len; ++l) {
                    btop += *query++;
                    btop += '-';
                }
            }
        }
    }
    if(match_len > 0)
        btop  += to_string(match_len);

    return btop;
}

TCharAlign CCigar::ToAlign(const char* query, const char* subject) const {
    TCharAlign align;
    query += m_qfrom;
    subject += m_sfrom;
    for(auto& element : m_elements) {
        if(element.m_type == 'M') {
            align.first.insert(align.first.end(), query, query+element.m_len);
            query += element.m_len;
            align.second.insert(align.second.end(), subject, subject+element.m_len);
            subject += element.m_len;
        } else if(element.m_type == 'D') {
            align.first.insert(align.first.end(), element.m_len, '-');
            align.second.insert(align.second.end(), subject, subject+element.m_len);
            subject += element.m_len;
        } else {
            align.first.insert(align.first.end(), query, query+element.m_len);
            query += element.m_len;
            align.second.insert(align.second.end(), element.m_len, '-');
        }
    }

    return align;
}

int CCigar::Matches(const char* query, const char* subject) const {
    int matches = 0;
    query += m_qfrom;
    subject += m_sfrom;
    for(auto& element : m_elements) {
        if(element.m_type == 'M') {
            for(int l = 0; l < element.m_len; ++l) {
                if(*query == *subject)
                    ++matches;
                ++query;
                ++subject;
            }
        } else if(element.m_type == 'D') {
            subject += element.m_len;
        } else {
            query += element.m_len;
        }
    }

    return matches;
}

TScore CCigar::Score(const char* query, const char* subject, TScore gopen, TScore gapextend, const CScoringMatrix& delta) const {
    TScore score = 0;

    query += m_qfrom;
    subject += m_sfrom;
    for(auto& element : m_elements) {
        if(element.m_type == 'M') {
            for(int l = 0; l < element.m_len; ++l) {
                score += delta.Score(*query, *subject);
                ++query;
                ++subject;
            }
        } else if(element.m_type == 'D') {
            subject += element.m_len;
            score += gopen+gapextend*(element.m_len-1);
        } else {
            query += element.m_len;
            score += gopen+gapextend*(element.m_len-1);
        }
    }

    return score;
}

void CCigar::PrintAlign(const char* query, const char* subject, const CScoringMatrix& delta, ostream& os) const {
    TCharAlign align = ToAlign(query, subject);
    os << align.first << "\n";        
    for(unsigned p = 0; p < align.first.size(); ++p) {
        char a = align.first[p];
        char b = align.second[p];
        if(a == '-' || b == '-')
            os << " ";
        else if(a == b)
            os << "|";
        else if(delta.Score(a, b) > 0)
            os << "+";
        else
            os << " ";
    }
    os << "\n" << align.second << "\n";
}

}; // namespace
