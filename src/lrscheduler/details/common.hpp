#ifndef REFLUO_LRSCHEDULER_COMMON_HPP
#define REFLUO_LRSCHEDULER_COMMON_HPP

namespace Refluo::LrScheduler::Details {

    class Scheduler {
    public:
        virtual ~Scheduler() = default;
        virtual void step() = 0;
    };

}  // namespace Refluo::LrScheduler::Details

#endif // REFLUO_LRSCHEDULER_COMMON_HPP
