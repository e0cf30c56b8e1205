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

#ifndef PAIRALIGN_EXCEPTION__HPP
#define PAIRALIGN_EXCEPTION__HPP

#include <stdexcept>
#include <string>

using namespace std;
namespace PairAlign {

// All errors detected by the aligners are reported with this exception.
// The error code allows callers to react (e.g. retry with a wider band) without parsing messages.
class CAlignException : public runtime_error {
public:
    enum EErrCode {
        eInvalidInput,       // sequence could not be obtained or has wrong type
        eEmptySequence,      // empty after trimming
        eInvalidGapPenalty,  // gap_open or gap_extend > 0
        eUnknownMatrix,      // name not in registry
        eBandConstraint,     // bandwidth can't accommodate the alignment
        eInvalidOption       // unknown aligner, gap model, etc.
    };

    CAlignException(EErrCode code, const string& msg) : runtime_error(msg), m_code(code) {}
    EErrCode GetErrCode() const { return m_code; }
    const char* GetErrCodeString() const {
        switch(m_code) {
        case eInvalidInput:      return "eInvalidInput";
        case eEmptySequence:     return "eEmptySequence";
        case eInvalidGapPenalty: return "eInvalidGapPenalty";
        case eUnknownMatrix:     return "eUnknownMatrix";
        case eBandConstraint:    return "eBandConstraint";
        case eInvalidOption:     return "eInvalidOption";
        default:                 return "eUnknown";
        }
    }

private:
    EErrCode m_code;
};

}; // namespace

#endif  // PAIRALIGN_EXCEPTION__HPP
