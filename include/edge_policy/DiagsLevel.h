/** @file

  Diagnostic severity levels.

  @section license License

  Licensed to the Apache Software Foundation (ASF) under one
  or more contributor license agreements.  See the NOTICE file
  distributed with this work for additional information
  regarding copyright ownership.  The ASF licenses this file
  to you under the Apache License, Version 2.0 (the
  "License"); you may not use this file except in compliance
  with the License.  You may obtain a copy of the License at

      http://www.apache.org/licenses/LICENSE-2.0

  Unless required by applicable law or agreed to in writing, software
  distributed under the License is distributed on an "AS IS" BASIS,
  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
  See the License for the specific language governing permissions and
  limitations under the License.
 */

#pragma once

namespace edge_policy
{
enum DiagsLevel { // do not renumber --- used as array index
  DL_Diag = 0,    // trace output, "trace" in configuration
  DL_Debug,       // tagged debug output
  DL_Status,
  DL_Note,        // default threshold, "info" in configuration
  DL_Warning,
  DL_Error,
  DL_Fatal,
  DL_Alert,
  DL_Emergency,
  DL_Undefined    // must be last, used for size!
};

#define EDGE_POLICY_DIAGS_LEVEL_COUNT ::edge_policy::DL_Undefined

} // namespace edge_policy
