#pragma once

namespace vc::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

}
