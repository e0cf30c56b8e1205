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

#ifndef PAIRALIGN_ALIGNERS__HPP
#define PAIRALIGN_ALIGNERS__HPP

#include <string>
#include <vector>
#include <memory>

#include "alignment.hpp"

using namespace std;
namespace PairAlign {

// Common interface of all pairwise aligners. Aligners keep no state between calls and may be
// used concurrently. Invalid input is reported with CAlignException.
class CAligner {
public:
    virtual ~CAligner() = default;

    SAlignmentResult Align(const string& seq1, const string& seq2, const SAlignmentOptions& options) const { return DoAlign(seq1, seq2, options); }
    SAlignmentResult Align(const string& seq1, const string& seq2) const { return DoAlign(seq1, seq2, DefaultOptions()); }
    virtual SAlignmentOptions DefaultOptions() const { return SAlignmentOptions(); }
    virtual string Name() const = 0;

protected:
    virtual SAlignmentResult DoAlign(const string& seq1, const string& seq2, const SAlignmentOptions& options) const = 0;

    // validates gaps first, then reports which sequence is empty (global and local)
    static void ValidateAndPrepare(const string& seq1, const string& seq2, const SAlignmentOptions& options, string& a, string& b);
    // checks the sequences first, then the gaps (other variants)
    static void PrepareAndValidate(const string& seq1, const string& seq2, const SAlignmentOptions& options, string& a, string& b);
};

//Needleman-Wunsch
class CGlobalAligner : public CAligner {
public:
    string Name() const override { return "global"; }
protected:
    SAlignmentResult DoAlign(const string& seq1, const string& seq2, const SAlignmentOptions& options) const override;
};

//Smith-Waterman
class CLocalAligner : public CAligner {
public:
    string Name() const override { return "local"; }
protected:
    SAlignmentResult DoAlign(const string& seq1, const string& seq2, const SAlignmentOptions& options) const override;
};

//end gaps on both sequences are free
class CSemiGlobalAligner : public CAligner {
public:
    string Name() const override { return "semiglobal"; }
protected:
    SAlignmentResult DoAlign(const string& seq1, const string& seq2, const SAlignmentOptions& options) const override;
};

//suffix of seq1 overlaps prefix of seq2; unaligned seq1 suffix and seq2 prefix are free
class COverlapAligner : public CAligner {
public:
    string Name() const override { return "overlap"; }
protected:
    SAlignmentResult DoAlign(const string& seq1, const string& seq2, const SAlignmentOptions& options) const override;
};

//global alignment restricted to diagonals |j-i| <= bandwidth
class CBandedAligner : public CAligner {
public:
    string Name() const override { return "banded"; }
protected:
    SAlignmentResult DoAlign(const string& seq1, const string& seq2, const SAlignmentOptions& options) const override;
};

//Hirschberg; linear memory, linear gaps (every gap position costs gap_open, gap_extend is ignored)
class CSpaceEfficientAligner : public CAligner {
public:
    string Name() const override { return "hirschberg"; }
    SAlignmentOptions DefaultOptions() const override {
        SAlignmentOptions options;
        options.m_gap_open = -1;
        return options;
    }

    // last row of the Needleman-Wunsch score matrix for a vs b computed in O(len(b)) memory
    static vector<TScore> LastRowScores(const string& a, const string& b, TScore gap, const CScoringMatrix& delta);
protected:
    SAlignmentResult DoAlign(const string& seq1, const string& seq2, const SAlignmentOptions& options) const override;
};

// global|nw, local|sw, semiglobal|semi-global, overlap, banded, hirschberg|space-efficient (case-insensitive)
// throws CAlignException(eInvalidOption) for anything else
unique_ptr<CAligner> CreateAligner(const string& name);
const vector<string>& AlignerNames();

}; // namespace

#endif  // PAIRALIGN_ALIGNERS__HPP
