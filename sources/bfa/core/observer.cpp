//
// Created by gregorian-rayne on 2/11/26.
//

#include "bfa/observer.hpp"

namespace bfa
{
    IAnalysisObserver& null_observer() noexcept {
        static IAnalysisObserver observer;
        return observer;
    }
}  // namespace bfa
