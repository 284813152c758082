#pragma once

#include <sstream>
#include <string>

#include "parley/parley_config.hpp"
#include "parley/session.hpp"

// Each demo shell command exposes two pieces:
//  - handle_<command>: executes the command; returns whether to continue the shell
//  - help_<command>: help text shown by "help <command>"

// ask <string|integer|float>
bool handle_ask(std::istringstream& iss, parley::Session& session, const parley::ParleyConfig& config);
std::string help_ask();

// agree
bool handle_agree(std::istringstream& iss, parley::Session& session, const parley::ParleyConfig& config);
std::string help_agree();

// pick [rows|inline|columns_across|columns_down]
bool handle_pick(std::istringstream& iss, parley::Session& session, const parley::ParleyConfig& config);
std::string help_pick();

// list <mode> <items...>
bool handle_list(std::istringstream& iss, parley::Session& session, const parley::ParleyConfig& config);
std::string help_list();

// color <style...> -- <text>
bool handle_color(std::istringstream& iss, parley::Session& session, const parley::ParleyConfig& config);
std::string help_color();

// page [count]
bool handle_page(std::istringstream& iss, parley::Session& session, const parley::ParleyConfig& config);
std::string help_page();

// secret
bool handle_secret(std::istringstream& iss, parley::Session& session, const parley::ParleyConfig& config);
std::string help_secret();

// gather [count]
bool handle_gather(std::istringstream& iss, parley::Session& session, const parley::ParleyConfig& config);
std::string help_gather();

// exit / quit
bool handle_exit(std::istringstream& iss, parley::Session& session, const parley::ParleyConfig& config);
std::string help_exit();
