#include "nj_base.hpp"

namespace nestjar::basics
{

InterruptFlag &this_thread_interrupt_flag() noexcept
{
    static thread_local InterruptFlag g_interrupt_flag;
    return g_interrupt_flag;
}

} // namespace nestjar::basics
