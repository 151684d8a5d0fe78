// ======================================================================
// \title  Utils.cpp
// \brief  CFDP utilities source file
//
// This file is a port of CFDP utility functions from the following files
// from the NASA Core Flight System (cFS) CFDP (CF) Application, version 3.0.0,
// adapted for use within cfdpd:
// - cf_utils.c (CFDP utility functions)
//
// ======================================================================
//
// NASA Docket No. GSC-18,447-1
//
// Copyright (c) 2019 United States Government as represented by the
// Administrator of the National Aeronautics and Space Administration.
// All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License"); you may
// not use this file except in compliance with the License. You may obtain
// a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//
// ======================================================================

#include <Cfdpd/Ccsds/Cfdp/Utils.hpp>

#include <cstdio>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

std::string TransactionId::toString() const {
    char text[32];
    snprintf(text, sizeof(text), "%" CFDP_PRI_ENTITY_ID ":%" CFDP_PRI_TRANSACTION_SEQ, this->sourceEid, this->seq);
    return std::string(text);
}

bool TxnStatusIsError(TxnStatus txn_stat)
{
    /* The value of TXN_STATUS_UNDEFINED (-1) indicates a transaction is in progress and no error
     * has occurred yet.  This will be set to TXN_STATUS_NO_ERROR (0) after successful completion
     * of the transaction (FIN/EOF).  Anything else indicates a problem has occurred. */
    return (txn_stat > TXN_STATUS_NO_ERROR);
}

ConditionCode TxnStatusToConditionCode(TxnStatus txn_stat)
{
    ConditionCode result;

    if (!TxnStatusIsError(txn_stat))
    {
        /* If no status has been set (TXN_STATUS_UNDEFINED), treat that as NO_ERROR for
         * the purpose of CFDP CC.  This can occur e.g. when sending ACK PDUs and no errors
         * have happened yet, but the transaction is not yet complete and thus not final. */
        result = CONDITION_CODE_NO_ERROR;
    }
    else
    {
        switch (txn_stat)
        {
            /* The 4-bit codes (0-15) share the same numeric values as the CFDP condition codes */
            case TXN_STATUS_NO_ERROR:
            case TXN_STATUS_POS_ACK_LIMIT_REACHED:
            case TXN_STATUS_KEEP_ALIVE_LIMIT_REACHED:
            case TXN_STATUS_INVALID_TRANSMISSION_MODE:
            case TXN_STATUS_FILESTORE_REJECTION:
            case TXN_STATUS_FILE_CHECKSUM_FAILURE:
            case TXN_STATUS_FILE_SIZE_ERROR:
            case TXN_STATUS_NAK_LIMIT_REACHED:
            case TXN_STATUS_INACTIVITY_DETECTED:
            case TXN_STATUS_INVALID_FILE_STRUCTURE:
            case TXN_STATUS_CHECK_LIMIT_REACHED:
            case TXN_STATUS_UNSUPPORTED_CHECKSUM_TYPE:
            case TXN_STATUS_SUSPEND_REQUEST_RECEIVED:
            case TXN_STATUS_CANCEL_REQUEST_RECEIVED:
                result = static_cast<ConditionCode>(txn_stat);
                break;

            /* An exhausted ACK limit is a positive ACK limit fault whichever
             * acknowledgment was being waited on */
            case TXN_STATUS_ACK_LIMIT_NO_FIN:
            case TXN_STATUS_ACK_LIMIT_NO_EOF:
                result = CONDITION_CODE_POS_ACK_LIMIT_REACHED;
                break;

            default:
                /* Catch-all: any invalid protocol state will cancel the transaction, and thus this
                 * is the closest CFDP CC in practice for all other unhandled errors. */
                result = CONDITION_CODE_CANCEL_REQUEST_RECEIVED;
                break;
        }
    }

    return result;
}

const char* TxnStatusName(TxnStatus txn_stat)
{
    switch (txn_stat)
    {
        case TXN_STATUS_UNDEFINED:
            return "UNDEFINED";
        case TXN_STATUS_NO_ERROR:
            return "NO_ERROR";
        case TXN_STATUS_POS_ACK_LIMIT_REACHED:
            return "POS_ACK_LIMIT_REACHED";
        case TXN_STATUS_KEEP_ALIVE_LIMIT_REACHED:
            return "KEEP_ALIVE_LIMIT_REACHED";
        case TXN_STATUS_INVALID_TRANSMISSION_MODE:
            return "INVALID_TRANSMISSION_MODE";
        case TXN_STATUS_FILESTORE_REJECTION:
            return "FILESTORE_REJECTION";
        case TXN_STATUS_FILE_CHECKSUM_FAILURE:
            return "FILE_CHECKSUM_FAILURE";
        case TXN_STATUS_FILE_SIZE_ERROR:
            return "FILE_SIZE_ERROR";
        case TXN_STATUS_NAK_LIMIT_REACHED:
            return "NAK_LIMIT_REACHED";
        case TXN_STATUS_INACTIVITY_DETECTED:
            return "INACTIVITY_DETECTED";
        case TXN_STATUS_INVALID_FILE_STRUCTURE:
            return "INVALID_FILE_STRUCTURE";
        case TXN_STATUS_CHECK_LIMIT_REACHED:
            return "CHECK_LIMIT_REACHED";
        case TXN_STATUS_UNSUPPORTED_CHECKSUM_TYPE:
            return "UNSUPPORTED_CHECKSUM_TYPE";
        case TXN_STATUS_SUSPEND_REQUEST_RECEIVED:
            return "SUSPEND_REQUEST_RECEIVED";
        case TXN_STATUS_CANCEL_REQUEST_RECEIVED:
            return "CANCEL_REQUEST_RECEIVED";
        case TXN_STATUS_PROTOCOL_ERROR:
            return "PROTOCOL_ERROR";
        case TXN_STATUS_ACK_LIMIT_NO_FIN:
            return "ACK_LIMIT_NO_FIN";
        case TXN_STATUS_ACK_LIMIT_NO_EOF:
            return "ACK_LIMIT_NO_EOF";
        case TXN_STATUS_NAK_RESPONSE_ERROR:
            return "NAK_RESPONSE_ERROR";
        case TXN_STATUS_SEND_EOF_FAILURE:
            return "SEND_EOF_FAILURE";
        case TXN_STATUS_EARLY_FIN:
            return "EARLY_FIN";
        default:
            return "UNKNOWN";
    }
}

const char* ConditionCodeName(ConditionCode cc)
{
    // Condition codes are a subset of the transaction status values
    return TxnStatusName(static_cast<TxnStatus>(cc));
}

namespace {

bool actionHasSecondFileName(FilestoreAction action)
{
    return (action == FILESTORE_ACTION_RENAME_FILE) || (action == FILESTORE_ACTION_APPEND_FILE) ||
           (action == FILESTORE_ACTION_REPLACE_FILE);
}

}  // namespace

bool FilestoreRequestToTlv(const FilestoreRequest& request, Tlv& tlv)
{
    const bool hasSecond = actionHasSecondFileName(request.action);
    const FwSizeType firstLen = request.firstFileName.size();
    const FwSizeType secondLen = hasSecond ? request.secondFileName.size() : 0;

    // action byte, first LV, optional second LV
    const FwSizeType total = 1 + 1 + firstLen + (hasSecond ? (1 + secondLen) : 0);
    if (total > Tlv::MAX_VALUE_LENGTH)
    {
        return false;
    }

    U8 value[Tlv::MAX_VALUE_LENGTH];
    FwSizeType pos = 0;
    value[pos++] = static_cast<U8>((request.action & 0x0F) << 4);
    value[pos++] = static_cast<U8>(firstLen);
    request.firstFileName.copy(reinterpret_cast<char*>(&value[pos]), firstLen);
    pos += firstLen;
    if (hasSecond)
    {
        value[pos++] = static_cast<U8>(secondLen);
        request.secondFileName.copy(reinterpret_cast<char*>(&value[pos]), secondLen);
        pos += secondLen;
    }

    tlv.initialize(TLV_TYPE_FILESTORE_REQUEST, value, static_cast<U8>(pos));
    return true;
}

bool TlvToFilestoreRequest(const Tlv& tlv, FilestoreRequest& request)
{
    if (tlv.getType() != TLV_TYPE_FILESTORE_REQUEST || tlv.getLength() < 2)
    {
        return false;
    }

    const U8* value = tlv.getData();
    const U8 length = tlv.getLength();
    U8 pos = 0;

    request.action = static_cast<FilestoreAction>((value[pos++] >> 4) & 0x0F);
    if (request.action > FILESTORE_ACTION_DENY_DIRECTORY)
    {
        return false;
    }

    const U8 firstLen = value[pos++];
    if (static_cast<U32>(pos) + firstLen > length)
    {
        return false;
    }
    request.firstFileName.assign(reinterpret_cast<const char*>(&value[pos]), firstLen);
    pos = static_cast<U8>(pos + firstLen);

    request.secondFileName.clear();
    if (actionHasSecondFileName(request.action))
    {
        if (pos >= length)
        {
            return false;
        }
        const U8 secondLen = value[pos++];
        if (static_cast<U32>(pos) + secondLen > length)
        {
            return false;
        }
        request.secondFileName.assign(reinterpret_cast<const char*>(&value[pos]), secondLen);
    }

    return true;
}

bool MessageToUserToTlv(const std::string& message, Tlv& tlv)
{
    if (message.size() > Tlv::MAX_VALUE_LENGTH)
    {
        return false;
    }
    tlv.initialize(TLV_TYPE_MESSAGE_TO_USER, reinterpret_cast<const U8*>(message.data()),
                   static_cast<U8>(message.size()));
    return true;
}

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd
