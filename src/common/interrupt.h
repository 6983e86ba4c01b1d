#ifndef SKYVAULT_COMMON_INTERRUPT_H_
#define SKYVAULT_COMMON_INTERRUPT_H_

namespace Skyvault {

// Installs SIGINT/SIGTERM handlers that only record the interrupt.
// Handlers are installed without SA_RESTART so blocking reads return EINTR.
void InstallInterruptHandlers();

bool InterruptRequested();

// Used by tests and by the handler itself.
void RequestInterrupt();
void ClearInterrupt();

} // namespace Skyvault

#endif // SKYVAULT_COMMON_INTERRUPT_H_
