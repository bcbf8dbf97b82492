//
// smb2diagnostics.hpp -
//
// EBS - RTSMB
//
// Copyright EBS Inc. , 2018
// All rights reserved.
// This code may not be redistributed in source or linkable object form
// without the consent of its author.
//
// Module description:
//  Leveled diagnostics used by the wire codec. Instances inherit the
//  process wide threshold unless set_diag_level() is called.
//

#ifndef include_smb2diagnostics
#define include_smb2diagnostics

#include <cstdarg>
#include <cstdio>
#include <string>
#include <vector>

#include "smb2defs.hpp"

class smb_diagnostics {
public:
  smb_diagnostics() { _p_diaglevel = smb2wire_get_diag_level(); }
  ~smb_diagnostics() { display_text_warnings(); }

  void set_diag_level(smb_diaglevel diaglevel) { _p_diaglevel =diaglevel;}
  smb_diaglevel diag_level() const { return _p_diaglevel; }

  void diag_dump_unicode(smb_diaglevel at_diaglayer, const char *prompt, const byte *buffer, int size)
  {
    if (_p_diaglevel && _p_diaglevel >= at_diaglayer)
      smb2wire_dump_bytes(prompt, buffer, size, DUMPUNICODE);
  }
  void diag_dump_bin(smb_diaglevel at_diaglayer, const char *prompt, const byte *buffer, int size)
  {
    if (_p_diaglevel && _p_diaglevel >= at_diaglayer)
      smb2wire_dump_bytes(prompt, buffer, size, DUMPBIN);
  }
  void diag_dump_bin(smb_diaglevel at_diaglayer,  const char *prompt, const void *buffer, int size)   { diag_dump_bin(at_diaglayer, prompt, (const byte *)buffer, size); }

  void display_text_warnings()
  {
     for (size_t i = 0; i <  warnings.size(); i++)
        diag_printf(DIAG_INFORMATIONAL,"Warning: %s\n", warnings[i].c_str());
     warnings.clear();
  }

  void diag_text_warning(const char* fmt...)
  {
      char buffer[512];
      va_list args;
      va_start(args, fmt);
      vsnprintf (buffer, sizeof(buffer), fmt, args);
      va_end(args);
      warnings.push_back(std::string(buffer));
  }
 //  note: use %ls to display utf16
  void diag_printf(smb_diaglevel at_diaglayer, const char* fmt...)
  {
      if (!_p_diaglevel || _p_diaglevel < at_diaglayer)
        return;
      char buffer[512];
      va_list args;
      va_start(args, fmt);
      vsnprintf (buffer, sizeof(buffer), fmt, args);
      va_end(args);
      cout << buffer;
  }

private:
  smb_diaglevel _p_diaglevel;
  std::vector<std::string> warnings;
};

#endif // include_smb2diagnostics
