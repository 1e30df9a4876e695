#pragma once

// C++ Includes
#include <string>
#include <vector>

// NuMCMC Includes
#include "Manager/NuMCMCException.h"

_NuMCMC_Safe_Include_Start_ //{
// ROOT Includes
#include "TMacro.h"
#include "TList.h"
#include "TObjString.h"
// yaml Includes
#include "yaml-cpp/yaml.h"
_NuMCMC_Safe_Include_End_ //}

/// @file YamlHelper.h
/// @brief Config access and YAML conversions used across NuMCMCTools

// **********************
/// @brief Whether the chain of map keys exists, e.g. {"Credible", "Levels"}
inline bool CheckNodeExists(const YAML::Node& node, const std::vector<std::string>& path) {
// **********************
  YAML::Node current = node;
  for(const auto& key : path) {
    if(!current.IsMap()) return false;
    const YAML::Node child = static_cast<const YAML::Node&>(current)[key];
    if(!child) return false;
    current.reset(child);
  }
  return true;
}

// **********************
/// @brief Use this like this CheckNodeExists(config, "Credible", "Levels");
template<typename... Keys>
bool CheckNodeExists(const YAML::Node& node, const Keys&... keys) {
// **********************
  return CheckNodeExists(node, std::vector<std::string>{keys...});
}

// **********************
/// @brief Emit YAML node as text
inline std::string YAMLtoSTRING(const YAML::Node& node) {
// **********************
  YAML::Emitter emitter;
  emitter << node;
  return emitter.c_str();
}

// **********************
/// @brief Parse text as YAML
/// @throws NuMCMCException if text is not valid YAML
inline YAML::Node STRINGtoYAML(const std::string& text) {
// **********************
  try {
    return YAML::Load(text);
  } catch (const YAML::ParserException& e) {
    NUMCMCLOG_ERROR("Can't parse as YAML: {}", e.what());
    throw NuMCMCException(__FILE__, __LINE__);
  }
}

// **********************
/// @brief Parse lines of TMacro as YAML
/// @throws NuMCMCException if macro doesn't hold valid YAML
inline YAML::Node TMacroToYAML(const TMacro& macro) {
// **********************
  std::string text;
  if (TList* lines = macro.GetListOfLines()) {
    for (TObject* obj : *lines) {
      if (auto line = dynamic_cast<TObjString*>(obj)) {
        text += line->GetString().Data();
        text += '\n';
      }
    }
  }
  return STRINGtoYAML(text);
}

// **********************
/// @brief Store YAML node in a TMacro so it can be written to a ROOT file
/// @param name Name and title of macro
inline TMacro YAMLtoTMacro(const YAML::Node& yaml_node, const std::string& name) {
// **********************
  TMacro macro(name.c_str(), name.c_str());
  macro.AddLine(YAMLtoSTRING(yaml_node).c_str());
  return macro;
}

// **********************
/// @brief Set value under a chain of keys, last argument is the value
/// @code
/// OverrideConfig(config, "General", "OutputFile", "Posteriors.root");
/// @endcode
template <typename TValue>
void OverrideConfig(YAML::Node node, std::string const &key, TValue val) {
// **********************
  node[key] = val;
}
template <typename... Args>
void OverrideConfig(YAML::Node node, std::string const &key, Args... args) {
// **********************
  OverrideConfig(node[key], args...);
}

// **********************
/// @brief Convert existing node, File and Line point to the caller
template<typename Type>
Type ConvertNode(const YAML::Node& node, const std::string& File, const int Line) {
// **********************
  try {
    return node.as<Type>();
  } catch (const YAML::BadConversion& e) {
    NUMCMCLOG_ERROR("YAML type mismatch: {}", e.what());
    NUMCMCLOG_ERROR("While trying to access variable {}", YAMLtoSTRING(node));
    throw NuMCMCException(File, Line);
  }
}

// **********************
/// @brief Get content of config file, node has to exist
template<typename Type>
Type Get(const YAML::Node& node, const std::string File, const int Line) {
// **********************
  if (!node) {
    NUMCMCLOG_ERROR("Required config entry is missing");
    throw NuMCMCException(File, Line);
  }
  return ConvertNode<Type>(node, File, Line);
}

// **********************
/// @brief Get content of config file, default value if node doesn't exist
template<typename Type>
Type GetFromManager(const YAML::Node& node, Type defval, const std::string File = __FILE__, const int Line = __LINE__) {
// **********************
  if (!node) return defval;
  return ConvertNode<Type>(node, File, Line);
}

// **********************
/// @brief Open YAML file, File and Line point to the caller
inline YAML::Node LoadYamlConfig(const std::string& filename, const std::string& File, const int Line) {
// **********************
  try {
    return YAML::LoadFile(filename);
  } catch (const YAML::Exception& e) {
    NUMCMCLOG_ERROR("Can't open config {}: {}", filename, e.what());
    throw NuMCMCException(File, Line);
  }
}

/// Macro to simplify calling LoadYaml with file and line info
#define NMOpenConfig(filename) LoadYamlConfig((filename), __FILE__, __LINE__)

/// Macro to simplify calling Get with file and line info
#define NMGet(Type, node) Get<Type>((node), __FILE__, __LINE__)
