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

#ifndef PAIRALIGN_SEQ_READER__HPP
#define PAIRALIGN_SEQ_READER__HPP

#include <string>
#include <vector>

using namespace std;
namespace PairAlign {

//  CSequenceReader gets records from fasta or fastq files (plain or gzipped, '-' for stdin).
//  Format validation for fasta: '>' starts defline
//  Format validation for fastq: '@' and '+' start first and third lines in every block of four lines
//  Sequences keep their case; line breaks are removed. Letters, '*' and '-' are accepted.
//  Errors are reported with CAlignException(eInvalidInput).

struct SSequenceRecord {
    string m_id;
    string m_seq;
};

string ErrorMsg(const string& file, int line, const string& msg);

class CSequenceReader {
public:
    CSequenceReader(const string& file) : m_file(file) {}
    // all records in the file; throws if there is none
    vector<SSequenceRecord> ReadAll() const;
    // first record in the file
    SSequenceRecord ReadFirst() const;

private:
    string m_file;
};

}; // namespace

#endif  // PAIRALIGN_SEQ_READER__HPP
