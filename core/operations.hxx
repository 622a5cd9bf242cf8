/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *   Copyright 2025-Present Couchbase, Inc.
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */

#pragma once

#include "core/operations/management/alternate_addresses_setup.hxx"
#include "core/operations/management/bucket_create.hxx"
#include "core/operations/management/bucket_flush.hxx"
#include "core/operations/management/bucket_get.hxx"
#include "core/operations/management/certificate_reload.hxx"
#include "core/operations/management/cluster_init.hxx"
#include "core/operations/management/cluster_tasks_get.hxx"
#include "core/operations/management/collection_create.hxx"
#include "core/operations/management/node_add.hxx"
#include "core/operations/management/node_list_get.hxx"
#include "core/operations/management/node_services_get.hxx"
#include "core/operations/management/pool_get.hxx"
#include "core/operations/management/rebalance.hxx"
#include "core/operations/management/rebalance_progress_get.hxx"
#include "core/operations/management/sample_bucket_install.hxx"
#include "core/operations/management/scope_create.hxx"
#include "core/operations/management/scope_get_all.hxx"
#include "core/operations/management/trusted_cas_load.hxx"
