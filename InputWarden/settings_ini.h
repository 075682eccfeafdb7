#pragma once

// settings.ini <-> settings.h globals (+ Logger enable flag)
// Load returns false when the file does not exist (defaults stay).
bool SettingsIni_Load(const wchar_t* path);
bool SettingsIni_Save(const wchar_t* path);
