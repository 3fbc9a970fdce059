#pragma once

namespace wb::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

}
