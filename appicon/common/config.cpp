#include "config.hpp"
#include "logger.hpp"
#include <fstream>
#include <sstream>
#include <cctype>
#include <climits>
#include <cstdlib>
#include <set>

namespace appicon {

// Position just past "key": and any whitespace, or npos.
static size_t value_pos(const std::string& s, const std::string& key){
  auto pos = s.find("\""+key+"\"");
  if(pos==std::string::npos) return pos;
  pos = s.find(":", pos);
  if(pos==std::string::npos) return pos;
  pos++;
  while(pos<s.size() && std::isspace((unsigned char)s[pos])) pos++;
  return pos;
}

static bool scan_number(const std::string& s, size_t& pos, double& out){
  size_t end=pos;
  while(end<s.size() && (std::isdigit((unsigned char)s[end]) || s[end]=='.' || s[end]=='-' || s[end]=='e' || s[end]=='E' || s[end]=='+')) end++;
  if(end==pos) return false;
  std::string tok = s.substr(pos, end-pos);
  char* stop=nullptr;
  out = std::strtod(tok.c_str(), &stop);
  if(stop==tok.c_str()) return false;
  pos = end;
  return true;
}

// Integral value that fits an int; fractions truncate.
static bool to_int(double d, int& out){
  if(!(d >= (double)INT_MIN && d <= (double)INT_MAX)) return false;
  out = (int)d;
  return true;
}

static bool parse_int(const std::string& s, const std::string& key, int& out, std::string& err){
  size_t pos = value_pos(s, key);
  if(pos==std::string::npos) return true;
  double d=0;
  if(!scan_number(s, pos, d)){ err="\""+key+"\" must be a number"; return false; }
  if(!to_int(d, out)){ err="\""+key+"\" is out of range"; return false; }
  return true;
}

static bool parse_bool(const std::string& s, const std::string& key, bool& out, std::string& err){
  size_t pos = value_pos(s, key);
  if(pos==std::string::npos) return true;
  if(s.compare(pos,4,"true")==0){ out=true; return true; }
  if(s.compare(pos,5,"false")==0){ out=false; return true; }
  err="\""+key+"\" must be true or false";
  return false;
}

static bool parse_string(const std::string& s, const std::string& key, std::string& out, std::string& err){
  size_t pos = value_pos(s, key);
  if(pos==std::string::npos) return true;
  if(pos>=s.size() || s[pos]!='"'){ err="\""+key+"\" must be a string"; return false; }
  pos++;
  size_t end = s.find("\"", pos);
  if(end==std::string::npos){ err="unterminated string for \""+key+"\""; return false; }
  out = s.substr(pos, end-pos);
  return true;
}

// "key": [16, 32, 48]
static bool parse_int_list(const std::string& s, const std::string& key, std::vector<int>& out, std::string& err){
  size_t pos = value_pos(s, key);
  if(pos==std::string::npos) return true;
  if(pos>=s.size() || s[pos]!='['){ err="\""+key+"\" must be an array"; return false; }
  pos++;
  std::vector<int> vals;
  while(true){
    while(pos<s.size() && (std::isspace((unsigned char)s[pos]) || s[pos]==',')) pos++;
    if(pos>=s.size()){ err="unterminated array for \""+key+"\""; return false; }
    if(s[pos]==']') break;
    double d=0;
    if(!scan_number(s, pos, d)){ err="\""+key+"\" must hold only numbers"; return false; }
    int v=0;
    if(!to_int(d, v)){ err="\""+key+"\" holds an out-of-range value"; return false; }
    vals.push_back(v);
  }
  out.swap(vals);
  return true;
}

bool load_config_json(const std::string& path, Config& C, std::string& err){
  std::ifstream f(path);
  if(!f){ err="Could not open config: "+path; return false; }
  std::ostringstream ss; ss<<f.rdbuf();
  std::string s=ss.str();

  return parse_string(s,"out_dir", C.out_dir, err)
      && parse_string(s,"icon_name", C.icon_name, err)
      && parse_string(s,"preview_name", C.preview_name, err)
      && parse_int_list(s,"sizes", C.sizes, err)
      && parse_int(s,"preview_size", C.preview_size, err)
      && parse_bool(s,"skip_existing", C.skip_existing, err)
      && parse_string(s,"log_file", C.log_file, err)
      && parse_string(s,"log_level", C.log_level, err);
}

bool validate_config(const Config& C, std::string& err){
  if(C.out_dir.empty()){ err="out_dir must not be empty"; return false; }
  if(C.icon_name.empty() || C.preview_name.empty()){ err="output file names must not be empty"; return false; }
  if(C.sizes.empty()){ err="sizes must list at least one frame"; return false; }
  std::set<int> seen;
  for(int s: C.sizes){
    if(s<1 || s>256){ err="icon frame size "+std::to_string(s)+" outside 1..256"; return false; }
    if(!seen.insert(s).second){ err="icon frame size "+std::to_string(s)+" listed twice"; return false; }
  }
  if(C.preview_size<1 || C.preview_size>kMaxPreviewSize){
    err="preview_size "+std::to_string(C.preview_size)+" outside 1.."+std::to_string(kMaxPreviewSize);
    return false;
  }
  LogLevel L;
  if(!parse_level(C.log_level, L)){ err="unknown log_level: "+C.log_level; return false; }
  return true;
}

} // namespace appicon
