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

#ifndef PAIRALIGN_OUTPUT__HPP
#define PAIRALIGN_OUTPUT__HPP

#include <string>
#include <ostream>

#include "alignment.hpp"

using namespace std;
namespace PairAlign {

enum EOutputFormat { ePretty, eTsv };

// "pretty" or "tsv"; throws CAlignException(eInvalidOption) otherwise
EOutputFormat ParseOutputFormat(const string& name);

void WriteTsvHeader(ostream& os);

// seq1/seq2 are the sequences the result refers to (after case normalization)
void WriteAlignment(ostream& os, EOutputFormat format, const string& id1, const string& id2, const string& seq1, const string& seq2,
                    const SAlignmentResult& result, const CScoringMatrix& delta);

}; // namespace

#endif  // PAIRALIGN_OUTPUT__HPP
