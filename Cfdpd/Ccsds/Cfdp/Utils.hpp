// ======================================================================
// \title  Utils.hpp
// \brief  CFDP utilities header
//
// This file is a port of CFDP utility functions from the following files
// from the NASA Core Flight System (cFS) CFDP (CF) Application, version 3.0.0,
// adapted for use within cfdpd:
// - cf_utils.h (CFDP utility function declarations)
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

#ifndef Cfdpd_Ccsds_Cfdp_Utils_HPP
#define Cfdpd_Ccsds_Cfdp_Utils_HPP

#include <string>

#include <Cfdpd/Ccsds/Cfdp/Types/Types.hpp>
#include <Cfdpd/Ccsds/Cfdp/Types/Tlv.hpp>
#include <Cfdpd/Ccsds/Cfdp/Types/UserTypes.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

/************************************************************************/
/** @brief Converts the internal transaction status to a CFDP condition code
 *
 * Transaction status is a superset of condition codes, and includes
 * other error conditions for which CFDP will not send FIN/ACK/EOF
 * and thus there is no corresponding condition code.
 *
 * @param txn_stat   Transaction status
 *
 * @returns CFDP protocol condition code
 */
ConditionCode TxnStatusToConditionCode(TxnStatus txn_stat);

/************************************************************************/
/** @brief Check if the internal transaction status represents an error
 *
 * @param txn_stat   Transaction status
 *
 * @retval true if an error has occurred during the transaction
 * @retval false if no error has occurred during the transaction yet
 */
bool TxnStatusIsError(TxnStatus txn_stat);

/************************************************************************/
/** @brief Names for logging and reports
 */
const char* TxnStatusName(TxnStatus txn_stat);
const char* ConditionCodeName(ConditionCode cc);

/************************************************************************/
/** @brief Encode a filestore request as a Metadata option TLV
 *
 * @returns false if a filename is longer than an LV allows
 */
bool FilestoreRequestToTlv(const FilestoreRequest& request, Tlv& tlv);

/************************************************************************/
/** @brief Decode a filestore request option TLV
 *
 * @returns false if the TLV is not a well formed filestore request
 */
bool TlvToFilestoreRequest(const Tlv& tlv, FilestoreRequest& request);

/************************************************************************/
/** @brief Encode a message to user as a Metadata option TLV
 *
 * @returns false if the message is longer than a TLV allows
 */
bool MessageToUserToTlv(const std::string& message, Tlv& tlv);

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

#endif  // Cfdpd_Ccsds_Cfdp_Utils_HPP
