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

#ifndef PAIRALIGN_SCORING_MATRIX__HPP
#define PAIRALIGN_SCORING_MATRIX__HPP

#include <string>
#include <vector>
#include <map>

using namespace std;
namespace PairAlign {

typedef double TScore;

// Substitution scores for pairs of characters. Keys are case-insensitive: every score
// is stored for all case combinations so that the DP loops can use Score() directly.
// A pair which was never set scores 0.
class CScoringMatrix {
public:
    typedef map<char, map<char, TScore>> TTable;

    explicit CScoringMatrix(const string& name = "CUSTOM");
    CScoringMatrix(TScore match, TScore mismatch, const string& name = "DNA");   // matrix for DNA/RNA (T==U, N never matches)
    explicit CScoringMatrix(const TTable& table, const string& name = "CUSTOM");
    CScoringMatrix(const string& alphabet, const int* scores, const string& name); // square table in alphabet order

    void Set(char a, char b, TScore score);
    TScore Score(char a, char b) const {
        unsigned char ua = a;
        unsigned char ub = b;
        if(ua >= kAlphabetSize || ub >= kAlphabetSize)
            return 0;
        return m_matrix[ua*kAlphabetSize+ub];
    }

    const string& Name() const { return m_name; }
    const string& Alphabet() const { return m_alphabet; }    // upper-case symbols with explicit scores

private:
    enum { kAlphabetSize = 128 };

    string m_name;
    string m_alphabet;
    vector<TScore> m_matrix;
};

// Registry of the predefined matrices: BLOSUM45/50/62/80/90, PAM30/70/120/250, DNA_SIMPLE, DNA_FULL

// case-insensitive; throws CAlignException(eUnknownMatrix) listing the available names
const CScoringMatrix& GetMatrix(const string& name);
// upper-cases both characters; 0 for pairs not in the matrix
TScore GetScore(const CScoringMatrix& matrix, char a, char b);
const vector<string>& MatrixNames();
// distinct upper-cased symbols of seq outside the matrix alphabet, in order of appearance; they score 0
string UnscoredSymbols(const CScoringMatrix& matrix, const string& seq);

}; // namespace

#endif  // PAIRALIGN_SCORING_MATRIX__HPP
