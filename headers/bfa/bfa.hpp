//
// Created by gregorian-rayne on 2/16/26.
//

#ifndef BFA_BFA_HPP
#define BFA_BFA_HPP

/**
 * @file bfa.hpp
 * @brief Main header for the Bus Factor Analyzer library.
 *
 * Include this header to get access to all public APIs.
 */

#include "bfa/version.hpp"
#include "bfa/error.hpp"
#include "bfa/result.hpp"
#include "bfa/types.hpp"
#include "bfa/config.hpp"
#include "bfa/observer.hpp"

#include "bfa/ownership/ownership_resolver.hpp"
#include "bfa/ownership/authorship_aggregator.hpp"
#include "bfa/decay/knowledge_decay.hpp"
#include "bfa/simulation/removal_simulator.hpp"
#include "bfa/report/report.hpp"
#include "bfa/report/json_report.hpp"
#include "bfa/methods/method.hpp"

#include "bfa/io/authorship_io.hpp"
#include "bfa/git/git_integration.hpp"
#include "bfa/git/collector.hpp"
#include "bfa/utils/json_utils.hpp"

#endif //BFA_BFA_HPP
