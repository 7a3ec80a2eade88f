/* Flow-TaskQ: Core
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file

/// @cond
// -^- Doxygen, please ignore the following.  This is wacky macro magic and not a regular `#pragma once` header.

/* The includer defines FLOW_LOG_CFG_COMPONENT_DEFINE(ARG_name_root, ARG_enum_val) before each #include of this
 * file: once to generate the taskq::Log_component members; once to generate S_TASKQ_LOG_COMPONENT_NAME_MAP.
 * Keep the numbers dense and starting at 0; Config::standard_component_payload_enum_sparse_length() relies on it. */

// Rarely used component corresponding to log call sites outside namespace `taskq::X`, for all X in ::taskq.
FLOW_LOG_CFG_COMPONENT_DEFINE(UNCAT, 0)
// Logging from namespace taskq::task.
FLOW_LOG_CFG_COMPONENT_DEFINE(TASK, 1)
// Logging from namespace taskq::sched.
FLOW_LOG_CFG_COMPONENT_DEFINE(SCHED, 2)

// -v- Doxygen, please stop ignoring.
/// @endcond
