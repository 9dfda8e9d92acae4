// Ticket: 0001_first_start_bootstrap

#ifndef OSC_STORE_SETTINGS_STORE_HPP
#define OSC_STORE_SETTINGS_STORE_HPP

namespace osc_store
{

/**
 * @brief Abstract interface for the durable application flags
 *
 * Reads of a flag that was never written return its default:
 * isFirstAppStart() is true on a fresh install, isFileLoggingEnabled() is
 * false.
 *
 * All methods throw std::runtime_error when the underlying storage cannot be
 * read or written. Implementations must be safe to call from several threads.
 */
class SettingsStore
{
public:
  virtual ~SettingsStore() = default;

  virtual bool isFirstAppStart() = 0;
  virtual void setFirstAppStart(bool firstAppStart) = 0;

  virtual bool isFileLoggingEnabled() = 0;
  virtual void setFileLoggingEnabled(bool enabled) = 0;

protected:
  SettingsStore() = default;
  SettingsStore(const SettingsStore&) = default;
  SettingsStore& operator=(const SettingsStore&) = default;
  SettingsStore(SettingsStore&&) noexcept = default;
  SettingsStore& operator=(SettingsStore&&) noexcept = default;
};

}  // namespace osc_store

#endif  // OSC_STORE_SETTINGS_STORE_HPP
