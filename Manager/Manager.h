#pragma once

// NuMCMC Includes
#include "Manager/YamlHelper.h"
#include "Manager/Monitor.h"
#include "Manager/NuMCMCException.h"

//Joy of forward declaration https://gieseanw.wordpress.com/2018/02/25/the-joys-of-forward-declarations-results-from-the-real-world/
class TFile;

/// @brief The manager class is responsible for managing configurations and settings.
class manager {
public:
  /// @brief Constructs a manager object with the specified file name.
  /// @param filename The name of the configuration file.
  explicit manager(std::string const &filename);
  /// @brief Constructs a manager object with the specified YAML
  /// @param ConfigNode Actual YAML config
  manager(const YAML::Node ConfigNode);

  /// @brief Destroys the manager object.
  virtual ~manager();

  /// @brief Add manager useful information's to TFile, config and build settings
  /// @param OutputFile The ROOT TFile to which the information will be added.
  void SaveSettings(TFile* const OutputFile) const;

  /// @brief Print currently used config
  void Print() const;

  /// @brief Apply command line overrides of form Section:Key=Value, e.g. General:BatchSize=5000
  /// @param Overrides List of override strings
  void ApplyOverrides(const std::vector<std::string>& Overrides);

  /// @brief Return name of config
  inline std::string GetFileName() const {return FileName;}
  /// @brief Return config
  inline YAML::Node const &raw() const {return config;}
  /// @brief Get class name
  inline std::string GetName() const {return "Manager";};

  /// @brief Overrides the configuration settings based on provided arguments.
  /// @code
  /// FitManager->OverrideSettings("General", "OutputFile", "Posteriors.root");
  /// @endcode
  template <typename... Args>
  void OverrideSettings(Args&&... args) {
    OverrideConfig(config, std::forward<Args>(args)...);
  }

  private :
    /// @brief Common inialiser for both constructors
    void Initialise();

  /// The YAML node containing the configuration data.
  YAML::Node config;
  /// The name of the configuration file.
  std::string FileName;
};
